#include "fits_inspect/pipeline/pipeline.hpp"
#include "fits_inspect/core/events.hpp"
#include "fits_inspect/core/utils.hpp"
#include "fits_inspect/io/fits_io.hpp"
#include "fits_inspect/pipeline/classifier.hpp"
#include "fits_inspect/pipeline/extractor.hpp"
#include "fits_inspect/render/renderer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <streambuf>

namespace fits_inspect::pipeline {

using json = nlohmann::json;

const char* const kNoPlottableMessage = "This FITS file is valid but contains no plottable HDUs.";
const char* const kNoNumericDataMessage = "No HDU contains numeric image data.";

namespace {

// Discards events when no sink was given.
class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return c; }
};

class Run {
public:
    Run(const fs::path& fits_path, const fs::path& previews_dir, const RunOptions& options)
        : fits_path_(fits_path),
          previews_dir_(previews_dir),
          cfg_(options.config),
          file_id_(options.file_id.value_or(core::random_hex_id(8))),
          run_id_(core::get_run_id()),
          null_out_(&null_buf_),
          out_(options.log ? *options.log : null_out_),
          emitter_(options.log != nullptr && options.config.logging.events),
          verbose_(options.config.logging.verbose) {}

    void execute(PipelineResult& result) {
        emitter_.run_start(run_id_,
                           {{"fits_path", fits_path_.string()},
                            {"previews_dir", previews_dir_.string()},
                            {"file_id", file_id_}},
                           out_);

        if (!io::is_fits_path(fits_path_)) {
            warn(result, "File extension is not a recognised FITS extension: " +
                             fits_path_.filename().string());
        }

        // Extract
        emitter_.stage_start(run_id_, Stage::EXTRACT, out_);
        auto extracted = extract(fits_path_, cfg_.classify);
        if (!extracted) {
            emitter_.stage_end(run_id_, Stage::EXTRACT, "error",
                               {{"error", extracted.failure().message}}, out_);
            fail(result, extracted.failure().message);
            return;
        }
        std::vector<UnitSummary> summaries = extracted.take();
        emitter_.stage_end(run_id_, Stage::EXTRACT, "ok", {{"units", summaries.size()}}, out_);

        switch (gate_summaries(summaries)) {
            case Gate::NoPlottable:
                no_plottable(result);
                return;
            case Gate::NoNumericData:
                fail(result, kNoNumericDataMessage);
                return;
            case Gate::Proceed:
                break;
        }

        // Classify
        emitter_.stage_start(run_id_, Stage::CLASSIFY, out_);
        std::vector<Analysis> analyses;
        try {
            analyses = classify(fits_path_, summaries, cfg_.classify);
        } catch (const std::exception& e) {
            emitter_.stage_end(run_id_, Stage::CLASSIFY, "error", {{"error", e.what()}}, out_);
            fail(result, e.what());
            return;
        }
        for (const auto& a : analyses) {
            unit_event(Stage::CLASSIFY, a.index,
                       {{"classification", classification_to_string(a.classification)}});
        }
        emitter_.stage_end(run_id_, Stage::CLASSIFY, "ok", {{"units", analyses.size()}}, out_);

        if (gate_analyses(analyses) == Gate::NoPlottable) {
            no_plottable(result);
            return;
        }

        // Render
        emitter_.stage_start(run_id_, Stage::RENDER, out_);
        std::vector<std::optional<std::string>> previews(analyses.size());
        try {
            render::prepare_output_dir(previews_dir_);
            int rendered = 0;
            for (size_t i = 0; i < analyses.size(); ++i) {
                auto r = render::try_render_unit(fits_path_, analyses[i], previews_dir_, file_id_, cfg_);
                if (r) {
                    previews[i] = r.take();
                    ++rendered;
                    unit_event(Stage::RENDER, analyses[i].index, {{"preview", *previews[i]}});
                } else {
                    unit_event(Stage::RENDER, analyses[i].index,
                               {{"preview", nullptr}, {"reason", r.failure().message}});
                }
            }
            emitter_.stage_end(run_id_, Stage::RENDER, "ok", {{"rendered", rendered}}, out_);
        } catch (const std::exception& e) {
            std::fill(previews.begin(), previews.end(), std::nullopt);
            warn(result, std::string("Preview rendering failed: ") + e.what());
            emitter_.stage_end(run_id_, Stage::RENDER, "error", {{"error", e.what()}}, out_);
        }

        // Assemble
        result.units.reserve(analyses.size());
        for (size_t i = 0; i < analyses.size(); ++i) {
            const Analysis& a = analyses[i];
            UnitRecord rec;
            rec.index = a.index;
            rec.kind_name = a.kind_name;
            rec.classification = a.classification;
            rec.preview_url = previews[i];
            rec.metadata = a.header;
            rec.units = a.units;
            result.units.push_back(std::move(rec));
        }
        result.status = PipelineStatus::Success;
    }

    void fail(PipelineResult& result, const std::string& message) {
        result.status = PipelineStatus::Error;
        result.error = message;
        result.units.clear();
        emitter_.error(run_id_, message, out_);
    }

    void finish(const PipelineResult& result) {
        emitter_.run_end(run_id_, pipeline_status_to_string(result.status), out_);
    }

private:
    void no_plottable(PipelineResult& result) {
        result.status = PipelineStatus::ValidNoVisualizableData;
        result.message = kNoPlottableMessage;
    }

    void unit_event(Stage stage, int index, const json& extra) {
        if (verbose_) emitter_.unit_processed(run_id_, stage, index, extra, out_);
    }

    void warn(PipelineResult& result, const std::string& message) {
        result.warnings.push_back(message);
        emitter_.warning(run_id_, message, out_);
    }

    fs::path fits_path_;
    fs::path previews_dir_;
    const config::Config& cfg_;
    std::string file_id_;
    std::string run_id_;
    NullBuffer null_buf_;
    std::ostream null_out_;
    std::ostream& out_;
    core::EventEmitter emitter_;
    bool verbose_ = false;
};

} // namespace

Gate gate_summaries(const std::vector<UnitSummary>& summaries) {
    if (summaries.empty()) return Gate::NoPlottable;
    const bool any_numeric = std::any_of(summaries.begin(), summaries.end(),
                                         [](const UnitSummary& s) { return s.has_numeric_data; });
    return any_numeric ? Gate::Proceed : Gate::NoNumericData;
}

Gate gate_analyses(const std::vector<Analysis>& analyses) {
    const bool any_plottable = std::any_of(analyses.begin(), analyses.end(),
                                           [](const Analysis& a) { return is_plottable(a.classification); });
    return any_plottable ? Gate::Proceed : Gate::NoPlottable;
}

PipelineResult run(const fs::path& fits_path, const fs::path& previews_dir,
                   const std::optional<std::string>& display_name, const RunOptions& options) {
    PipelineResult result;
    result.file_name = display_name.value_or(fits_path.filename().string());
    try {
        Run r(fits_path, previews_dir, options);
        try {
            r.execute(result);
        } catch (const std::exception& e) {
            r.fail(result, e.what());
        }
        r.finish(result);
        return result;
    } catch (const std::exception& e) {
        result.status = PipelineStatus::Error;
        result.error = e.what();
        result.units.clear();
        return result;
    }
}

} // namespace fits_inspect::pipeline
