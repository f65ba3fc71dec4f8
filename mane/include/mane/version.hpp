#pragma once

namespace Mane
{
    constexpr char const* version = "0.1.0";
}
