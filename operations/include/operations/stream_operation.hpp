#pragma once

#include <operations/operation.hpp>
#include <replace/rule_set.hpp>

#include <istream>
#include <ostream>

namespace Operations
{
    /**
     * @brief Reads the whole input, rewrites it and writes it to the output. Empty input is an error.
     */
    class StreamOperation : public Operation
    {
      public:
        StreamOperation(Replace::RuleSet const& rules, std::istream& input, std::ostream& output);
        ~StreamOperation() override;
        StreamOperation(StreamOperation const&) = delete;
        StreamOperation(StreamOperation&&) = delete;
        StreamOperation& operator=(StreamOperation const&) = delete;
        StreamOperation& operator=(StreamOperation&&) = delete;

        std::expected<WorkStatus, Error> work() override;

        bool replacementsMade() const
        {
            return replacementsMade_;
        }

      private:
        Replace::RuleSet const* rules_;
        std::istream* input_;
        std::ostream* output_;
        bool replacementsMade_{false};
    };
}
