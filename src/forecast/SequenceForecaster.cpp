#include "stratus/forecast/SequenceForecaster.hpp"
#include "stratus/core/Errors.hpp"
#include "stratus/core/Log.hpp"

#include <cmath>

namespace stratus {

namespace {

// Per-column standardization fitted on the context window.
struct Scaler {
    std::vector<double> mean;
    std::vector<double> scale;

    static Scaler fit(const std::vector<std::vector<double>>& rows) {
        const std::size_t w = rows.front().size();
        Scaler s;
        s.mean.assign(w, 0.0);
        s.scale.assign(w, 0.0);

        const double n = static_cast<double>(rows.size());
        for (const auto& r : rows)
            for (std::size_t c = 0; c < w; ++c) s.mean[c] += r[c];
        for (auto& m : s.mean) m /= n;

        for (const auto& r : rows)
            for (std::size_t c = 0; c < w; ++c)
                s.scale[c] += (r[c] - s.mean[c]) * (r[c] - s.mean[c]);
        for (auto& v : s.scale) {
            v = std::sqrt(v / n);
            if (v == 0.0) v = 1.0;   // constant column
        }
        return s;
    }

    std::vector<double> transform(const std::vector<double>& r) const {
        std::vector<double> out(r.size());
        for (std::size_t c = 0; c < r.size(); ++c) out[c] = (r[c] - mean[c]) / scale[c];
        return out;
    }

    std::vector<double> inverse(const std::vector<double>& r) const {
        std::vector<double> out(r.size());
        for (std::size_t c = 0; c < r.size(); ++c) out[c] = r[c] * scale[c] + mean[c];
        return out;
    }
};

}

SequenceForecaster::SequenceForecaster(
    std::shared_ptr<const SequenceModel> m,
    std::size_t w,
    FallbackEstimator fb
) : model(std::move(m)),
    window(w),
    fallback(fb) {}

ForecastRun SequenceForecaster::forecast(
    const FeatureMatrix& features,
    int horizon,
    ForecastContext& ctx
) const {
    ForecastRun run;
    if (horizon <= 0) return run;
    run.points.reserve(static_cast<std::size_t>(horizon));

    try {
        if (!model) {
            throw ModelInferenceError("no sequence model loaded");
        }
        if (features.empty() || features.cols() < FeatureMatrix::BASE_COLUMNS) {
            throw ModelInferenceError("no usable feature rows");
        }
        if (window == 0) {
            throw ModelInferenceError("context window is zero");
        }
        if (model->inputSize() != FeatureMatrix::BASE_COLUMNS ||
            model->outputSize() < FeatureMatrix::BASE_COLUMNS) {
            throw ModelInferenceError("model shape does not match the four resource metrics");
        }

        std::vector<std::vector<double>> rows = features.baseTail(window);
        if (rows.size() < window) {
            // Left-pad with the earliest row.
            rows.insert(rows.begin(), window - rows.size(), rows.front());
        }

        const Scaler scaler = Scaler::fit(rows);
        std::vector<std::vector<double>> scaled;
        scaled.reserve(rows.size());
        for (const auto& r : rows) scaled.push_back(scaler.transform(r));

        for (int h = 0; h < horizon; ++h) {
            std::vector<double> pred = model->predict(scaled);
            pred.resize(FeatureMatrix::BASE_COLUMNS);

            const std::vector<double> raw = scaler.inverse(pred);
            for (double v : raw) {
                if (!std::isfinite(v)) {
                    throw ModelInferenceError("non-finite prediction at step " + std::to_string(h + 1));
                }
            }

            run.points.push_back(make_point(h + 1, ctx.as_of, raw[0], raw[1], raw[2], raw[3]));

            scaled.erase(scaled.begin());
            scaled.push_back(std::move(pred));
        }
    } catch (const ModelInferenceError& e) {
        const int produced = static_cast<int>(run.points.size());
        STRATUS_LOG_WARN("SEQ", "%s: %s; fallback for %d of %d points",
                         ctx.resource_id.c_str(), e.what(), horizon - produced, horizon);

        ForecastSet rest = fallback.estimate(features, produced, horizon - produced,
                                             ctx.as_of, ctx.noise);
        run.fallback_points = horizon - produced;
        run.points.insert(run.points.end(), rest.begin(), rest.end());
    }

    return run;
}

}
