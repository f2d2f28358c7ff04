// PyBind11 bindings for the codegym core.
// Exposes Action, Observation, EpisodeState and CodeEpisode to Python.
// JSON values (metadata, wire messages) cross the boundary as strings.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DCODEGYM_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config/env_config.hpp"
#include "env/code_episode.hpp"
#include "env/observation.hpp"
#include "extract/test_result_extractor.hpp"
#include "util/log.hpp"
#include "wire/wire_format.hpp"

namespace py = pybind11;

namespace {

codegym::CodeEpisode episodeFor(const std::string& language, const std::string& config_path) {
    if (config_path.empty()) return codegym::makeEpisode(language);
    return codegym::makeEpisode(codegym::loadEnvConfig(config_path, language));
}

} // namespace

PYBIND11_MODULE(codegym_bindings, m) {
    m.doc() = "codegym C++ core bindings";

    py::register_exception<codegym::ActionTypeError>(m, "ActionTypeError", PyExc_ValueError);
    py::register_exception<codegym::ConfigError>(m, "ConfigError", PyExc_RuntimeError);

    // ── Action ──
    py::class_<codegym::Action>(m, "Action")
        .def(py::init<>())
        .def(py::init([](std::string core_code, std::string test_code, std::string language) {
                 return codegym::Action{std::move(core_code), std::move(test_code),
                                        std::move(language)};
             }),
             py::arg("core_code"), py::arg("test_code") = "", py::arg("language") = "")
        .def_readwrite("core_code", &codegym::Action::core_code)
        .def_readwrite("test_code", &codegym::Action::test_code)
        .def_readwrite("language", &codegym::Action::language);

    // ── Observation ──
    py::class_<codegym::Observation>(m, "Observation")
        .def(py::init<>())
        .def_readwrite("stdout", &codegym::Observation::stdout_text)
        .def_readwrite("stderr", &codegym::Observation::stderr_text)
        .def_readwrite("exit_code", &codegym::Observation::exit_code)
        .def_readwrite("tests_passed", &codegym::Observation::tests_passed)
        .def_readwrite("tests_failed", &codegym::Observation::tests_failed)
        .def_readwrite("code_compiles", &codegym::Observation::code_compiles)
        .def_readwrite("reward", &codegym::Observation::reward)
        .def_readwrite("done", &codegym::Observation::done)
        .def_property_readonly("metadata_json", [](const codegym::Observation& obs) {
            return obs.metadata.dump();
        })
        .def("to_json", [](const codegym::Observation& obs) {
            return codegym::observationToJson(obs).dump();
        });

    // ── EpisodeState ──
    py::class_<codegym::EpisodeState>(m, "EpisodeState")
        .def(py::init<>())
        .def_readwrite("episode_id", &codegym::EpisodeState::episode_id)
        .def_readwrite("step_count", &codegym::EpisodeState::step_count)
        .def_readwrite("last_exit_code", &codegym::EpisodeState::last_exit_code)
        .def_readwrite("last_code_compiles", &codegym::EpisodeState::last_code_compiles)
        .def_readwrite("total_tests_passed", &codegym::EpisodeState::total_tests_passed)
        .def_readwrite("total_tests_failed", &codegym::EpisodeState::total_tests_failed)
        .def("to_json", [](const codegym::EpisodeState& s) {
            return codegym::stateToJson(s).dump();
        });

    // ── CodeEpisode ──
    py::class_<codegym::CodeEpisode>(m, "CodeEpisode")
        .def(py::init(&episodeFor), py::arg("language"), py::arg("config_path") = "")
        .def("reset", &codegym::CodeEpisode::reset)
        .def("step", &codegym::CodeEpisode::step, py::arg("action"))
        .def("step_json", [](codegym::CodeEpisode& ep, const std::string& request) {
            auto action = codegym::actionFromJson(nlohmann::json::parse(request));
            return codegym::observationToJson(ep.step(action)).dump();
        }, py::arg("request"))
        .def("state", &codegym::CodeEpisode::state)
        .def_property_readonly("language", &codegym::CodeEpisode::language);

    // ── Helpers ──
    m.def("supported_languages", &codegym::supportedLanguages);

    m.def("extract_verdict", [](const std::string& language, const std::string& out,
                                const std::string& err) {
        static const codegym::TestResultExtractor extractor = codegym::makeDefaultExtractor();
        auto ex = extractor.extractDetailed(language, out, err);
        return py::make_tuple(ex.verdict.passed, ex.verdict.failed, ex.strategy);
    }, py::arg("language"), py::arg("stdout"), py::arg("stderr") = "");

    m.def("default_config_json", [](const std::string& language) {
        return codegym::envConfigToJson(codegym::defaultEnvConfig(language)).dump(2);
    }, py::arg("language"));

    m.def("set_log_level", [](const std::string& level) {
        codegym::setLogLevel(codegym::parseLogLevel(level));
    }, py::arg("level"));
}
