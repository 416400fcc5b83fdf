#pragma once
#include <Eigen/Dense>

#include <array>

#include "autodiff.hpp"

template <typename T> using Grid = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
template <typename T> using VectorX = Eigen::Matrix<T, Eigen::Dynamic, 1>;

enum Channel : int
{
    kOCCUPANCY = 0,
    kRADIAL_VELOCITY = 1,
    kTANGENTIAL_VELOCITY = 2
};
inline constexpr int kN_CHANNELS{3};

// Egocentric log-polar tensor [3, Nr, Ntheta]; rows are radial bins, columns angular bins.
template <typename T> struct SaliencyMap
{
    std::array<Grid<T>, kN_CHANNELS> channels;

    SaliencyMap() = default;
    SaliencyMap(int n_r, int n_theta)
    {
        for (auto &channel : channels)
            channel = Grid<T>::Zero(n_r, n_theta);
    }

    int rows() const
    {
        return static_cast<int>(channels[kOCCUPANCY].rows());
    }
    int cols() const
    {
        return static_cast<int>(channels[kOCCUPANCY].cols());
    }
    bool empty() const
    {
        return channels[kOCCUPANCY].size() == 0;
    }
    bool has_shape(int n_r, int n_theta) const
    {
        for (const auto &channel : channels)
            if (channel.rows() != n_r || channel.cols() != n_theta)
                return false;
        return true;
    }
    Eigen::Index size() const
    {
        return kN_CHANNELS * channels[kOCCUPANCY].size();
    }

    Grid<T> &occupancy()
    {
        return channels[kOCCUPANCY];
    }
    const Grid<T> &occupancy() const
    {
        return channels[kOCCUPANCY];
    }

    bool all_finite() const
    {
        for (const auto &channel : channels)
            for (Eigen::Index i = 0; i < channel.size(); ++i)
                if (!is_finite(channel(i)))
                    return false;
        return true;
    }

    SaliencyMap<double> values() const
    {
        SaliencyMap<double> out;
        for (int k = 0; k < kN_CHANNELS; ++k)
            out.channels[k] = channels[k].unaryExpr([](const T &x) { return value_of(x); });
        return out;
    }

    // Channel-major, column-major within each channel.
    VectorX<T> flatten() const
    {
        const Eigen::Index block = channels[kOCCUPANCY].size();
        VectorX<T> flat(kN_CHANNELS * block);
        for (int k = 0; k < kN_CHANNELS; ++k)
            flat.segment(k * block, block) = channels[k].reshaped();
        return flat;
    }
};
