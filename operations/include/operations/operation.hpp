#pragma once

#include <shared_data/error.hpp>
#include <shared_data/operation_state.hpp>
#include <log/log.hpp>

#include <expected>
#include <optional>
#include <string_view>

namespace Operations
{
    class Operation
    {
      public:
        Operation() = default;
        Operation(Operation const&) = delete;
        Operation& operator=(Operation const&) = delete;
        Operation(Operation&&) = delete;
        Operation& operator=(Operation&&) = delete;

        virtual ~Operation() = default;

        using ErrorType = SharedData::ErrorType;
        using Error = SharedData::Error;
        using OperationState = SharedData::OperationState;

        enum class WorkStatus
        {
            MoreWork,
            Complete
        };

        /**
         * @brief Performs the next step of the operation. Each call handles a bounded amount of work, usually one
         * entry.
         *
         * @return Complete when nothing is left to do. Errors of individual entries do not fail the operation,
         * they are collected in the operation's report.
         */
        virtual std::expected<WorkStatus, Error> work() = 0;

        /**
         * @brief Calls work() until the operation completes or fails.
         */
        std::expected<void, Error> runToCompletion()
        {
            while (true)
            {
                auto result = work();
                if (!result)
                    return std::unexpected(std::move(result).error());
                if (*result == WorkStatus::Complete)
                    return {};
            }
        }

        OperationState state() const
        {
            return state_;
        }

        std::optional<Error> const& error() const
        {
            return error_;
        }

        template <typename T = void>
        std::expected<T, Error> enterErrorState(Error error)
        {
            state_ = OperationState::Failed;
            error_ = std::move(error);
            return std::unexpected(error_.value());
        }

      protected:
        void enterState(OperationState newState)
        {
            state_ = newState;
        }

        /**
         * @brief Response to work() in a final state. Does not change the state, so the outcome is kept.
         */
        std::expected<WorkStatus, Error> workInFinalState(std::string_view operationName) const
        {
            if (state_ == OperationState::Completed)
                Log::warn("{}: Operation already completed.", operationName);
            else
                Log::warn("{}: Operation already failed.", operationName);
            return std::unexpected(Error{
                .type = ErrorType::InvalidOperationState,
                .extraInfo = fmt::format(
                    "Cannot work a {} operation", boost::describe::enum_to_string(state_, "INVALID_ENUM_VALUE")),
            });
        }

      protected:
        OperationState state_{OperationState::NotStarted};
        std::optional<Error> error_{std::nullopt};
    };
}
