#pragma once

#include <utility/describe.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        ErrorType,
        InvalidRule,
        InvalidIgnorePattern,
        SourceNotFound,
        DestinationCollision,
        IOFailure,
        InvalidArguments,
        InvalidConfiguration,
        // Operation was worked after it completed or failed, indicates a bug in the program:
        InvalidOperationState);
}
