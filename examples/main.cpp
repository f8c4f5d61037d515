#include "parcelkit/parcelkit.hpp"

#include <boost/program_options.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace {

    struct Settings {
        std::vector<std::string> inputs;
        int depth = pk::UNLIMITED_DEPTH;
        std::string output = "output";
        double precision = 0.0;
        bool no_dedup = false;
        bool no_close = false;
        std::string log_level = "info";
        std::string history;
        bool force = false;
    };

    std::optional<Settings> configure(int argc, char **argv) {
        Settings s;
        std::string config_file;

        po::options_description cmdline("parcelkit_convert [options] input...");
        cmdline.add_options()("help,h", "print this help")(
            "config,c", po::value(&config_file), "INI style file providing any of the options below");

        po::options_description config("Conversion options");
        config.add_options()("input,i", po::value(&s.inputs)->composing(), "input file or directory of *.txt")(
            "depth", po::value(&s.depth)->default_value(s.depth),
            "directory levels to descend below each input directory, -1 for no limit")(
            "output,o", po::value(&s.output)->default_value(s.output), "output directory for the JSON results")(
            "precision", po::value(&s.precision)->default_value(s.precision),
            "tolerance in map units, <= 0 uses the file's precision attribute")(
            "no-dedup", po::bool_switch(&s.no_dedup), "keep duplicate points")(
            "no-close", po::bool_switch(&s.no_close), "do not auto-close open rings")(
            "log-level", po::value(&s.log_level)->default_value(s.log_level), "trace|debug|info|warn|error|off")(
            "history", po::value(&s.history), "file recording fingerprints of converted inputs")(
            "force", po::bool_switch(&s.force), "convert inputs even when already recorded in the history");

        po::options_description all;
        all.add(cmdline).add(config);

        po::positional_options_description positional;
        positional.add("input", -1);

        po::variables_map vars;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vars);
        if (vars.count("config")) {
            auto path = vars["config"].as<std::string>();
            std::ifstream ifs(path);
            if (!ifs)
                throw std::runtime_error("cannot open config file \"" + path + '"');
            po::store(po::parse_config_file(ifs, config), vars);
        }

        if (vars.count("help")) {
            std::cout << all << "\n";
            return std::nullopt;
        }
        po::notify(vars);

        if (s.inputs.empty())
            throw std::runtime_error("at least one input is required");
        return s;
    }

} // namespace

int main(int argc, char **argv) {
    try {
        auto settings = configure(argc, argv);
        if (!settings)
            return 0;

        pk::init_logging(settings->log_level);
        auto log = pk::logger();

        pk::GeometryOptions opts;
        opts.precision = settings->precision;
        opts.deduplicate = !settings->no_dedup;
        opts.auto_close = !settings->no_close;

        pk::ProcessingHistory history(settings->history);
        fs::create_directories(settings->output);

        auto files = pk::collect_files(settings->inputs, settings->depth);
        log->info("found {} input files", files.size());

        auto plan = pk::plan_batch(files, history, settings->force);
        std::size_t skipped = plan.skipped_history + plan.skipped_duplicate;
        std::size_t converted = 0, failed = plan.failed;
        for (const auto &source : plan.files) {
            const auto &file = source.path;
            try {
                auto decoded = pk::decode(source.content);
                if (!decoded.warning.empty())
                    log->warn("{}: {}", file.string(), decoded.warning);

                auto result = pk::convert(decoded.text, opts);
                auto out = fs::path(settings->output) / (file.stem().string() + ".json");
                pk::write_result(result, out);

                log->info("{} -> {} ({} parcels, {})", file.string(), out.string(), result.features.size(),
                          result.epsg > 0 ? result.crs : std::string("custom CRS"));
                ++converted;
            } catch (const std::exception &e) {
                log->error("{}: {}", file.string(), e.what());
                ++failed;
            }
        }

        log->info("done: {} converted, {} skipped, {} failed", converted, skipped, failed);
        return converted > 0 || (failed == 0 && skipped > 0) ? 0 : 1;
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
