#ifndef _TESTING_SIMULATED_SEQUENCE_RUNNER_H_
#define _TESTING_SIMULATED_SEQUENCE_RUNNER_H_

#include "base/defines.hpp"

namespace meshrtc {

class SimulatedSequenceRunner {
public:
    virtual ~SimulatedSequenceRunner() = default;

    // Provides next run time in milliseconds.
    virtual int64_t GetNextRunTimeMs() const = 0;
    // Runs all tasks ready at `at_time_ms`.
    virtual void RunReady(int64_t at_time_ms) = 0;
};

} // namespace meshrtc

#endif
