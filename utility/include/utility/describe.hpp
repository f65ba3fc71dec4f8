#pragma once

#include <boost/describe.hpp>
#include <boost/mp11.hpp>
