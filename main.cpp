#include "analysis/analyzer.h"
#include "analysis/configuration.h"
#include "frontend/summary_reader.h"
#include "ir/environment.h"

#include "boost/program_options.hpp"

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "z3++.h"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

void createLogger(const std::string &name, spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("logs/" + name + ".txt", true);
    file_sink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(console_sink);
    sinks.push_back(file_sink);

    auto logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
    logger->set_level(level);

    spdlog::register_logger(logger);
}

int main(int argc, char *argv[]) {
    boost::program_options::options_description command_line_options;

    boost::program_options::options_description generic_options("Generic options");
    generic_options.add_options()("help,h", "produce help message")(
            "verbose", boost::program_options::value<std::string>(), "output for diagnostic purpose [trace | info]")(
            "input-file,i", boost::program_options::value<std::string>(), "summary file")(
            "print-summaries", "prints the summaries of the input file");

    boost::program_options::options_description instantiation_options("Instantiation");
    instantiation_options.add_options()("entry,e", boost::program_options::value<std::vector<std::string>>(),
                                        "entry function, may be repeated (default = every summarized function)")(
            "no-warnings", "do not warn about unresolved assert conditions")(
            "check", "checks satisfiability of each instantiated constraint system")(
            "to-smt2", boost::program_options::value<std::string>(),
            "writes each instantiated constraint system to <prefix><entry>.smt2");

    command_line_options.add(generic_options).add(instantiation_options);

    boost::program_options::positional_options_description positionals;
    positionals.add("input-file", -1);

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store(boost::program_options::command_line_parser(argc, argv)
                                              .options(command_line_options)
                                              .positional(positionals)
                                              .run(),
                                      vm);
        boost::program_options::notify(vm);
    } catch (const boost::program_options::error &error) {
        std::cout << error.what() << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << command_line_options << std::endl;
        return 0;
    }

    if (!vm.count("input-file")) {
        std::cout << "No input file provided." << std::endl;
        return 1;
    }

    spdlog::level::level_enum level = spdlog::level::off;
    if (vm.count("verbose")) {
        if (vm["verbose"].as<std::string>() == "trace") {
            level = spdlog::level::trace;
        } else if (vm["verbose"].as<std::string>() == "info") {
            level = spdlog::level::info;
        } else {
            std::cout << "Invalid verbosity level provided." << std::endl;
            return 1;
        }
    }
    createLogger("Frontend", level);
    createLogger("Instantiation", level);
    createLogger("Analysis", level);

    std::unique_ptr<analysis::Configuration> configuration = std::make_unique<analysis::Configuration>();
    if (vm.count("entry")) {
        configuration->_entries = vm["entry"].as<std::vector<std::string>>();
    }
    if (vm.count("no-warnings")) {
        configuration->_warn_unresolved_asserts = false;
    }
    if (vm.count("check")) {
        configuration->_check_satisfiability = true;
    }
    if (vm.count("to-smt2")) {
        configuration->_smt2_prefix = vm["to-smt2"].as<std::string>();
    }

    z3::context context;
    try {
        auto summary_reader = std::make_unique<frontend::SummaryReader>(context);
        std::unique_ptr<ir::Environment> environment = summary_reader->fromXML(vm["input-file"].as<std::string>());
        if (vm.count("print-summaries")) {
            std::cout << *environment;
        }

        auto analyzer = std::make_unique<analysis::Analyzer>(std::move(configuration), *environment);
        analyzer->run();
        for (const auto &entry_to_warnings : analyzer->getWarnings()) {
            for (const analysis::Warning &warning : entry_to_warnings.second) {
                std::cout << warning << std::endl;
            }
        }
        for (const auto &entry_to_check_result : analyzer->getCheckResults()) {
            std::cout << entry_to_check_result.first << ": " << entry_to_check_result.second << std::endl;
        }
    } catch (const std::runtime_error &error) {
        std::cout << error.what() << std::endl;
        return 1;
    } catch (const std::logic_error &error) {
        std::cout << error.what() << std::endl;
        return 1;
    }

    return 0;
}
