#include "include/Errors.hpp"
#include "include/Options.hpp"
#include "include/Registry.hpp"
#include "include/Runner.hpp"
#include "include/Spawner.hpp"
#include "include/Status.hpp"
#include <clocale>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace rnr;

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    textdomain("rnr");

    RunOptions options;
    try {
        options = load_options(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << "rnr: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    }
    if (options.help) {
        print_usage(std::cout);
        return 0;
    }
    if (options.version) {
        std::cout << "rnr " << VERSION << std::endl;
        return 0;
    }

    try {
        const std::filesystem::path file = options.task_file
                                               ? std::filesystem::absolute(*options.task_file)
                                               : find_task_file(std::filesystem::current_path());
        TaskRegistry registry(file);
        PosixSpawner spawner(options.shell);
        const auto sink = make_sink(options.output, std::cout, std::cerr);
        Runner runner(registry, spawner, *sink, options, std::cout);

        if (options.list || !options.task) {
            runner.print_task_list(std::cout);
            return 0;
        }
        if (options.dry_run) {
            runner.print_plan(*options.task, std::cout);
            return 0;
        }
        return exit_status(runner.run(*options.task));
    } catch (const Error &e) {
        print_status(std::cerr, std::string(kind_name(e.kind())) + ": " + e.what(), "!!", true);
        return 1;
    } catch (const std::exception &e) {
        print_status(std::cerr, e.what(), "!!", true);
        return 1;
    }
}
