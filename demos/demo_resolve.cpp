// demo_resolve.cpp
//
// Resolves requirements against a live simple index and prints the pinned
// set. Requirements come from the command line, or from a requirements file
// given with -r:
//
//     ./demo_resolve "requests>=2.28" "rich"
//     ./demo_resolve -r requirements.txt
//     PYRES_PYTHON_VERSION=3.12 PYRES_OS=windows ./demo_resolve numpy
//
// Configuration is read from ~/.pyres/config.toml, ./pyres.toml and the
// PYRES_* environment variables, in that order.

#include <pyres/config.hpp>
#include <pyres/context.hpp>
#include <pyres/log.hpp>
#include <pyres/requirement.hpp>
#include <pyres/resolver.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pyres;

// ---------------------------------------------------------------------------
// Progress on stderr
// ---------------------------------------------------------------------------

class ProgressPrinter : public ResolverObserver {
public:
    void on_pin(const Candidate& c, size_t depth) override {
        log::debug("%*spin %s", static_cast<int>(depth * 2), "", c.to_string().c_str());
    }
    void on_backtrack(const ProjectName& name, size_t depth) override {
        ++backtracks_;
        log::debug("backtrack at %s (depth %zu)", name.raw().c_str(), depth);
    }
    void on_conflict(const PyresError& e) override {
        log::warn("no solution after %zu backtracks: %s", backtracks_, e.message.c_str());
    }

private:
    size_t backtracks_ = 0;
};

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------

struct Inputs {
    std::vector<Requirement> roots;
    std::vector<Requirement> constraints;
    std::vector<std::string> index_urls;
    bool pre = false;
};

Result<Inputs> parse_args(int argc, char** argv) {
    Inputs in;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-r") {
            if (i + 1 >= argc) {
                return PyresError{PyresError::InvalidArg, "-r needs a file",
                                  "usage: demo_resolve [-r file] [requirement...]"};
            }
            auto file = RequirementsFile::load(argv[++i]);
            if (file.is_err()) return std::move(file).error();
            auto& f = file.value();
            in.roots.insert(in.roots.end(), f.requirements.begin(), f.requirements.end());
            in.constraints.insert(in.constraints.end(), f.constraints.begin(), f.constraints.end());
            in.index_urls.insert(in.index_urls.end(), f.index_urls.begin(), f.index_urls.end());
            in.index_urls.insert(in.index_urls.end(), f.extra_index_urls.begin(),
                                 f.extra_index_urls.end());
            in.pre = in.pre || f.pre;
            continue;
        }
        auto req = Requirement::parse(arg);
        if (req.is_err()) return std::move(req).error();
        in.roots.push_back(std::move(req).value());
    }
    if (in.roots.empty()) {
        return PyresError{PyresError::InvalidArg, "no requirements given",
                          "usage: demo_resolve [-r file] [requirement...]"};
    }
    return Result<Inputs>::ok(std::move(in));
}

Result<Config> load_config() {
    std::optional<Config> global, project;
    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto g = Config::load(gpath);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }
    if (fs::exists("pyres.toml")) {
        auto p = Config::load("pyres.toml");
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }
    auto env = Config::from_env();
    if (env.is_err()) return std::move(env).error();
    return Result<Config>::ok(Config::effective(global, project, env.value()));
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

Result<ResolvedGraph> run(int argc, char** argv) {
    auto inputs = parse_args(argc, argv);
    PYRES_TRY(inputs);

    auto cfg = load_config();
    PYRES_TRY(cfg);
    log::set_level(cfg.value().effective_log_level());

    Inputs& in = inputs.value();
    // Index options in a requirements file win over configuration
    if (!in.index_urls.empty()) cfg.value().index.urls = in.index_urls;
    if (in.pre) cfg.value().resolve.prereleases = true;

    auto env = cfg.value().to_environment();
    PYRES_TRY(env);
    auto settings = cfg.value().to_context_settings();
    PYRES_TRY(settings);

    log::info("resolving %zu requirements for %s", in.roots.size(),
              env.value().to_string().c_str());

    RunContext ctx(env.value(),
                   std::make_unique<CurlTransport>(cfg.value().credentials()),
                   settings.value());
    ProgressPrinter progress;
    return resolve(ctx, in.roots, cfg.value().to_resolve_options(), in.constraints, &progress);
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);

    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return result.error().is_input_error() ? 2 : 1;
    }

    const ResolvedGraph& graph = result.value();
    std::cout << graph.tree() << "\n";
    std::cout << "install order:\n";
    for (const auto& name : graph.install_order()) {
        const ResolvedNode* node = graph.find(name);
        std::cout << "  " << node->package_url()
                  << "  " << node->candidate->file.url << "\n";
    }
    return 0;
}
