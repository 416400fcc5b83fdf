#pragma once
#include <cstdint>
#include <string>

#include "constants.hpp"

enum class PredictorKind : std::uint8_t
{
    kinematic,
    learned
};

struct Parameters
{
    // World
    double kWIDTH{600};
    double kHEIGHT{600};
    double kTIMESTEP{0.1};
    int kN_AGENTS{12};
    // Agent defaults
    double kRADIUS{2.0};
    double kMAX_SPEED{50.0};
    double kMAX_ACCEL{100.0};     // per second, bounds the velocity change per step
    double kPERSONAL_SPACE{20.0};
    double kHEADING_SPEED{0.1};   // heading follows velocity only above this speed
    // Saliency polar map
    int kNR{6};
    int kNTHETA{7};               // odd so one bin sits on the heading axis
    double kFOV_ANGLE{210.0 * kPI / 180.0};
    double kFOV_RANGE{100.0};
    double kSIGMA_R{0.5};         // kernel widths in bin units
    double kSIGMA_THETA{0.5};
    int kSPLAT_RADIUS{2};
    // Self-haze
    double kH_MAX{0.8};
    double kALPHA{10.0};          // sigmoid sensitivity
    double kOMEGA_THRESHOLD{0.05};
    double kGAMMA{2.0};           // haze attenuation exponent
    // Precision
    double kPI_MAX{1.0};
    double kDECAY_RATE{0.1};
    double kPRECISION_FLOOR{1e-6};
    // Expected free energy
    double kBETA{1.0};            // entropy weight
    double kGAMMA_INFO{0.5};      // information gain weight
    double kLAMBDA{0.1};          // pragmatic weight
    double kCOLLISION_GAIN{10.0};
    int kNEAR_BINS{3};
    double kTARGET_SPEED{20.0};
    // Action optimization
    int kMAX_ITER{5};
    double kETA{0.5};
    double kGRAD_CLIP{10.0};
    double kSMOOTHING{0.7};       // weight of the optimized action against the previous velocity
    double kMIN_INIT_SPEED{1.0};
    double kINIT_NOISE{5.0};
    // Prediction
    PredictorKind kPREDICTOR{PredictorKind::kinematic};
    double kPREDICTION_DT{0.1};
    int kHIDDEN_SIZE{32};
    // Diagnostics
    double kCOVERAGE_CELL{20.0};
    int kLOG_INTERVAL{100};
    int kFRAMERATE{::kFRAMERATE};
    int kROUNDS{::kROUNDS};
};

// Throws std::invalid_argument naming the first offending field.
void validate(const Parameters &p);

std::string to_string(PredictorKind kind);
