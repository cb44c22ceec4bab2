#ifndef PIPELINE_EXECUTOR_H
#define PIPELINE_EXECUTOR_H

#include <functional>

#include "event_loop.h"
#include "imei_scanner_types.h"

// Runs a pipeline job outside the caller's turn and reports back later.
// Completions may arrive after the submitter has moved on; the submitter
// decides whether the result still applies.
class PipelineExecutor {
public:
    typedef std::function<DetectionResult()> Job;
    typedef std::function<void(const DetectionResult&)> Completion;

    virtual ~PipelineExecutor() = default;

    virtual void submit(Job job, Completion done) = 0;
};

// Job and completion run together on a later turn of the event loop.
class LoopPipelineExecutor : public PipelineExecutor {
public:
    explicit LoopPipelineExecutor(EventLoop& event_loop) : loop(event_loop) {}

    void submit(Job job, Completion done) override {
        loop.post([job, done]() { done(job()); });
    }

private:
    EventLoop& loop;
};

#endif // PIPELINE_EXECUTOR_H
