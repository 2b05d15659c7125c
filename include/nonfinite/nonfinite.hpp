#ifndef NONFINITE_HPP
#define NONFINITE_HPP

#include "nonfinite/core/codec.hpp"
#include "nonfinite/core/errors.hpp"
#include "nonfinite/core/host.hpp"
#include "nonfinite/core/sentinels.hpp"
#include "nonfinite/core/width.hpp"

#endif // NONFINITE_HPP
