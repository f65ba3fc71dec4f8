#include <operations/stream_operation.hpp>
#include <log/log.hpp>
#include <utility/file_io.hpp>

#include <fmt/format.h>

namespace Operations
{
    StreamOperation::StreamOperation(Replace::RuleSet const& rules, std::istream& input, std::ostream& output)
        : Operation{}
        , rules_{&rules}
        , input_{&input}
        , output_{&output}
    {}

    StreamOperation::~StreamOperation() = default;

    std::expected<StreamOperation::WorkStatus, StreamOperation::Error> StreamOperation::work()
    {
        if (state_ == OperationState::Completed || state_ == OperationState::Failed)
            return workInFinalState("StreamOperation");

        enterState(OperationState::Running);
        auto input = Utility::readStream(*input_);
        if (!input)
        {
            return enterErrorState<WorkStatus>(Error{
                .type = ErrorType::IOFailure,
                .extraInfo = fmt::format("Could not read input: {}", input.error().message()),
            });
        }
        if (input->empty())
            return enterErrorState<WorkStatus>(Error{.type = ErrorType::IOFailure, .extraInfo = "No input provided"});

        const auto rewritten = rules_->apply(*input);
        replacementsMade_ = rewritten != *input;

        if (auto written = Utility::writeStream(*output_, rewritten); !written)
        {
            return enterErrorState<WorkStatus>(Error{
                .type = ErrorType::IOFailure,
                .extraInfo = fmt::format("Could not write output: {}", written.error().message()),
            });
        }

        if (!replacementsMade_ && !rules_->empty())
            Log::warn("StreamOperation: No replacements were made, check that the patterns exist in the input.");

        enterState(OperationState::Completed);
        return WorkStatus::Complete;
    }
}
