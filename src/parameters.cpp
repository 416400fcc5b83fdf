#include "parameters.hpp"

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace
{
void require(bool condition, const char *field, const std::string &rule)
{
    if (!condition)
        throw std::invalid_argument(fmt::format("Invalid parameter {}: {}", field, rule));
}

bool positive(double v)
{
    return std::isfinite(v) && v > 0.0;
}

bool non_negative(double v)
{
    return std::isfinite(v) && v >= 0.0;
}
} // namespace

void validate(const Parameters &p)
{
    require(positive(p.kWIDTH), "kWIDTH", "must be positive");
    require(positive(p.kHEIGHT), "kHEIGHT", "must be positive");
    require(positive(p.kTIMESTEP), "kTIMESTEP", "must be positive");
    require(p.kN_AGENTS >= 0, "kN_AGENTS", "must not be negative");

    require(positive(p.kRADIUS), "kRADIUS", "must be positive");
    require(positive(p.kMAX_SPEED), "kMAX_SPEED", "must be positive");
    require(positive(p.kMAX_ACCEL), "kMAX_ACCEL", "must be positive");
    require(positive(p.kPERSONAL_SPACE), "kPERSONAL_SPACE", "must be positive");
    require(non_negative(p.kHEADING_SPEED), "kHEADING_SPEED", "must not be negative");

    require(p.kNR >= 2, "kNR", "needs at least two radial bins");
    require(p.kNTHETA >= 1, "kNTHETA", "needs at least one angular bin");
    require(positive(p.kFOV_ANGLE) && p.kFOV_ANGLE <= kTWO_PI, "kFOV_ANGLE", "must lie in (0, 2pi]");
    require(positive(p.kFOV_RANGE) && p.kFOV_RANGE > p.kPERSONAL_SPACE, "kFOV_RANGE",
            "must exceed the personal space");
    require(positive(p.kSIGMA_R), "kSIGMA_R", "must be positive");
    require(positive(p.kSIGMA_THETA), "kSIGMA_THETA", "must be positive");
    require(p.kSPLAT_RADIUS >= 0, "kSPLAT_RADIUS", "must not be negative");

    require(positive(p.kH_MAX) && p.kH_MAX < 1.0, "kH_MAX", "must lie in (0, 1)");
    require(non_negative(p.kALPHA), "kALPHA", "must not be negative");
    require(std::isfinite(p.kOMEGA_THRESHOLD), "kOMEGA_THRESHOLD", "must be finite");
    require(non_negative(p.kGAMMA), "kGAMMA", "must not be negative");

    require(positive(p.kPI_MAX), "kPI_MAX", "must be positive");
    require(non_negative(p.kDECAY_RATE), "kDECAY_RATE", "must not be negative");
    require(positive(p.kPRECISION_FLOOR), "kPRECISION_FLOOR", "must be positive");

    require(non_negative(p.kBETA), "kBETA", "must not be negative");
    require(non_negative(p.kGAMMA_INFO), "kGAMMA_INFO", "must not be negative");
    require(non_negative(p.kLAMBDA), "kLAMBDA", "must not be negative");
    require(non_negative(p.kCOLLISION_GAIN), "kCOLLISION_GAIN", "must not be negative");
    require(p.kNEAR_BINS >= 1 && p.kNEAR_BINS <= p.kNR, "kNEAR_BINS", "must lie in [1, kNR]");
    require(non_negative(p.kTARGET_SPEED) && p.kTARGET_SPEED <= p.kMAX_SPEED, "kTARGET_SPEED",
            "must lie in [0, kMAX_SPEED]");

    require(p.kMAX_ITER >= 1, "kMAX_ITER", "needs at least one iteration");
    require(positive(p.kETA), "kETA", "must be positive");
    require(positive(p.kGRAD_CLIP), "kGRAD_CLIP", "must be positive");
    require(non_negative(p.kSMOOTHING) && p.kSMOOTHING <= 1.0, "kSMOOTHING", "must lie in [0, 1]");
    require(non_negative(p.kMIN_INIT_SPEED), "kMIN_INIT_SPEED", "must not be negative");
    require(non_negative(p.kINIT_NOISE), "kINIT_NOISE", "must not be negative");

    require(positive(p.kPREDICTION_DT), "kPREDICTION_DT", "must be positive");
    require(p.kHIDDEN_SIZE >= 1, "kHIDDEN_SIZE", "needs at least one hidden unit");

    require(positive(p.kCOVERAGE_CELL), "kCOVERAGE_CELL", "must be positive");
    require(p.kLOG_INTERVAL >= 1, "kLOG_INTERVAL", "must be at least 1");
    require(p.kFRAMERATE >= 1, "kFRAMERATE", "must be at least 1");
    require(p.kROUNDS >= 0, "kROUNDS", "must not be negative");
}

std::string to_string(PredictorKind kind)
{
    switch (kind)
    {
    case PredictorKind::kinematic:
        return "kinematic";
    case PredictorKind::learned:
        return "learned";
    }
    return "unknown";
}
