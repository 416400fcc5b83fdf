#pragma once
inline constexpr int kFRAMERATE{60};
inline constexpr int kROUNDS{10000};
inline constexpr double kPI{3.14159265358979323846};
inline constexpr double kTWO_PI{2.0 * kPI};
// Numerical guards
inline constexpr double kEPSILON{1e-6};        // additive guard before any normalization
inline constexpr double kENTROPY_EPSILON{1e-10}; // inside log(Pi + eps)
inline constexpr double kLOG_SCALE_EPSILON{1e-6};
// SPM occupancy above which a bin counts as occupied in stats
inline constexpr double kOCCUPIED_BIN{0.1};
// Scenarios
inline constexpr double kSPAWN_DISTANCE{150.0};
inline constexpr double kMIN_PERSONAL_SPACE{15.0};
inline constexpr double kPERSONAL_SPACE_SPREAD{20.0};
// Viewer
inline constexpr float kAGENT_DRAW_SCALE{2.0f};
inline constexpr float kHEATMAP_CELL{18.0f};
