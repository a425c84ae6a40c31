// batch.hpp

#pragma once

#include "config.hpp"

#include <elfscan/object_introspector.hpp>

#include <cstddef>
#include <vector>

namespace escan
{
    constexpr int exit_success = 0;
    constexpr int exit_error = 1;
    constexpr int exit_target_failed = 2;

    struct batch_result
    {
        std::vector<elfscan::object_introspector> objects;
        std::size_t failed = 0;

        int exit_status() const noexcept;
    };

    // introspects every target in order; a failed target does not stop the
    // batch, a SONAME contract violation does
    batch_result introspect_all(const std::vector<cfg::target_t>& targets,
        const elfscan::tool& tool);
}
