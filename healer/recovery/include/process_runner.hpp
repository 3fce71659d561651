#pragma once
#include <memory>
#include <string>
#include <vector>
#include "expected.hpp"
#include "types.hpp"


namespace healer::recovery {

    // Runs an external program and captures its stdout.
    struct IProcessRunner
    {
        virtual ~IProcessRunner() = default;

        // argv[0] is looked up on PATH. stdin is /dev/null, stderr is discarded.
        // Exec failure, death by signal and non-zero exit are failures.
        virtual Expected<Bytes> run(const std::vector<std::string>& argv) = 0;
    };

    std::shared_ptr<IProcessRunner> makePosixRunner();

} // namespace healer::recovery
