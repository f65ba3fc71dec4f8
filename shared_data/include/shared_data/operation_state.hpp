#pragma once

#include <utility/describe.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(OperationState, NotStarted, Scanning, Running, Renaming, Finalizing, Completed, Failed)
}
