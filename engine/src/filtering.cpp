#include "curvetrack/filtering.hpp"
#include "curvetrack/smoothing.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace curvetrack {

CurveData filterMedian(const CurveData& curve, const IndexSet& indices, int windowSize, Diagnostics* diag) {
    if (indices.empty()) return curve;
    if (windowSize < 3) {
        report(diag, DiagnosticCode::InsufficientData, -1, "median needs windowSize >= 3");
        return curve;
    }
    CurveData result = curve;
    const int half = windowSize / 2;
    const int last = static_cast<int>(curve.size()) - 1;
    std::vector<double> xs, ys;
    for (int idx : indices) {
        if (idx < 0 || idx > last) {
            report(diag, DiagnosticCode::InvalidSelection, idx, "index out of range");
            continue;
        }
        const int start = std::max(0, idx - half);
        const int end = std::min(last, idx + half);
        if (end - start < 2) {
            report(diag, DiagnosticCode::InsufficientData, idx, "median window has fewer than 3 points");
            continue;
        }
        xs.clear();
        ys.clear();
        for (int i = start; i <= end; ++i) {
            xs.push_back(curve[static_cast<std::size_t>(i)].x);
            ys.push_back(curve[static_cast<std::size_t>(i)].y);
        }
        std::sort(xs.begin(), xs.end());
        std::sort(ys.begin(), ys.end());
        Point& p = result[static_cast<std::size_t>(idx)];
        p.x = xs[xs.size() / 2];
        p.y = ys[ys.size() / 2];
    }
    return result;
}

CurveData filterAverage(const CurveData& curve, const IndexSet& indices, int windowSize, Diagnostics* diag) {
    return smoothMovingAverage(curve, indices, windowSize, diag);
}

CurveData filterGaussian(const CurveData& curve, const IndexSet& indices, int windowSize, double sigma,
                         Diagnostics* diag) {
    return smoothGaussian(curve, indices, windowSize, sigma, diag);
}

std::vector<double> butterworthFilter(const std::vector<double>& data, double cutoff, int order) {
    if (data.empty()) return {};
    const std::size_t n = data.size();
    std::vector<double> out(n);
    const double alpha = 1.0 / (1.0 + std::pow(1.0 / cutoff, 2.0 * order));
    out[0] = data[0];
    for (std::size_t i = 1; i < n; ++i) {
        out[i] = alpha * data[i] + (1.0 - alpha) * out[i - 1];
    }
    // reverse pass over the forward output for an approximately zero-phase response
    for (std::size_t i = n - 1; i-- > 0;) {
        out[i] = alpha * out[i] + (1.0 - alpha) * out[i + 1];
    }
    return out;
}

CurveData filterButterworth(const CurveData& curve, const IndexSet& indices, double cutoff, int order,
                            Diagnostics* diag) {
    if (!(cutoff > 0.0) || order < 1) {
        report(diag, DiagnosticCode::ParameterOutOfRange, -1, "butterworth needs cutoff > 0 and order >= 1");
        return curve;
    }
    for (int i : indices) {
        if (i < 0 || static_cast<std::size_t>(i) >= curve.size()) {
            report(diag, DiagnosticCode::InvalidSelection, i, "index out of range");
        }
    }
    const IndexSet valid = validIndices(indices, curve.size());
    if (valid.size() < 3) {
        report(diag, DiagnosticCode::InsufficientData, -1, "butterworth needs at least 3 selected points");
        return curve;
    }
    const int lo = valid.front();
    const int hi = valid.back();
    std::vector<double> xs, ys;
    xs.reserve(static_cast<std::size_t>(hi - lo + 1));
    ys.reserve(xs.capacity());
    for (int i = lo; i <= hi; ++i) {
        xs.push_back(curve[static_cast<std::size_t>(i)].x);
        ys.push_back(curve[static_cast<std::size_t>(i)].y);
    }
    const std::vector<double> fx = butterworthFilter(xs, cutoff, order);
    const std::vector<double> fy = butterworthFilter(ys, cutoff, order);

    CurveData result = curve;
    for (int i : valid) {
        const std::size_t k = static_cast<std::size_t>(i - lo);
        result[static_cast<std::size_t>(i)].x = fx[k];
        result[static_cast<std::size_t>(i)].y = fy[k];
    }
    return result;
}

CurveData filter(const CurveData& curve, const IndexSet& indices, FilterMethod method, const FilterParams& params,
                 Diagnostics* diag) {
    switch (method) {
    case FilterMethod::Median: return filterMedian(curve, indices, params.windowSize, diag);
    case FilterMethod::Average: return filterAverage(curve, indices, params.windowSize, diag);
    case FilterMethod::Gaussian: return filterGaussian(curve, indices, params.windowSize, params.sigma, diag);
    case FilterMethod::Butterworth: return filterButterworth(curve, indices, params.cutoff, params.order, diag);
    }
    return curve;
}

CurveData applySmoothingFiltering(const CurveData& curve, const IndexSet& indices, FilterKind kind,
                                  const FilterParams& params, Diagnostics* diag) {
    switch (kind) {
    case FilterKind::MovingAverage: return smoothMovingAverage(curve, indices, params.windowSize, diag);
    case FilterKind::Gaussian: return smoothGaussian(curve, indices, params.windowSize, params.sigma, diag);
    case FilterKind::SavitzkyGolay: return smoothSavitzkyGolay(curve, indices, params.windowSize, diag);
    case FilterKind::Median: return filterMedian(curve, indices, params.windowSize, diag);
    case FilterKind::Butterworth: return filterButterworth(curve, indices, params.cutoff, params.order, diag);
    case FilterKind::FilterAverage: return filterAverage(curve, indices, params.windowSize, diag);
    case FilterKind::FilterGaussian: return filterGaussian(curve, indices, params.windowSize, params.sigma, diag);
    }
    return curve;
}

const char* filterKindName(FilterKind kind) {
    switch (kind) {
    case FilterKind::MovingAverage: return "moving_average";
    case FilterKind::Gaussian: return "gaussian";
    case FilterKind::SavitzkyGolay: return "savitzky_golay";
    case FilterKind::Median: return "median";
    case FilterKind::Butterworth: return "butterworth";
    case FilterKind::FilterAverage: return "filter_average";
    case FilterKind::FilterGaussian: return "filter_gaussian";
    }
    return "unknown";
}

std::optional<FilterKind> filterKindFromName(const std::string& name) {
    const FilterKind all[] = {FilterKind::MovingAverage, FilterKind::Gaussian, FilterKind::SavitzkyGolay,
                              FilterKind::Median, FilterKind::Butterworth, FilterKind::FilterAverage,
                              FilterKind::FilterGaussian};
    for (FilterKind k : all) {
        if (name == filterKindName(k)) return k;
    }
    return std::nullopt;
}

} // namespace curvetrack
