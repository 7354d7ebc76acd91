#include <batchgrader/logging.hpp>

#include "app/grader_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace batchgrader;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args);

    return GraderApp{std::move(options)}.run();
}
