// result.hpp

#pragma once

#include <system_error>

#include <nonstd/expected.hpp>

namespace elfscan
{
    template<typename R>
    using result = nonstd::expected<R, std::error_code>;
}
