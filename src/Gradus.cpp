// gradus_lesson [config.json] [key=value ...]
// Runs the MNIST walkthrough. A first argument ending in ".json" is read as the
// lesson configuration; every remaining key=value token overrides one field.
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "../include/Gradus.h"

namespace {
    bool is_json_path(const std::string& argument) {
        constexpr std::string_view suffix = ".json";
        return argument.size() > suffix.size()
            && argument.compare(argument.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void print_usage(std::ostream& stream) {
        stream << "usage: gradus_lesson [config.json] [key=value ...]\n"
               << "keys: dataset_root, train_fraction, test_fraction, hidden, epochs, batch_size,\n"
               << "      learning_rate, momentum, optimizer, loss, normalize_mean, normalize_std,\n"
               << "      seed, use_cuda, panel_path, checkpoint_dir, color\n";
    }
}

int main(int argc, char** argv) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    if (!arguments.empty() && (arguments.front() == "-h" || arguments.front() == "--help")) {
        print_usage(std::cout);
        return 0;
    }

    try {
        Gradus::Config::LessonConfig config{};
        if (!arguments.empty() && is_json_path(arguments.front())) {
            config = Gradus::Config::Load(arguments.front());
            arguments.erase(arguments.begin());
        }
        Gradus::Config::ApplyOverrides(config, arguments);

        if (config.use_cuda && !torch::cuda::is_available()) {
            std::cerr << "[Gradus] CUDA requested but not available, using CPU." << std::endl;
            config.use_cuda = false;
        }

        (void)Gradus::Lesson::Run(config, &std::cout);
    } catch (const std::exception& error) {
        std::cerr << "[Gradus] error: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
