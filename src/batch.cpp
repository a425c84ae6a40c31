// batch.cpp

#include "batch.hpp"

#include <elfscan/log.hpp>

using namespace escan;
using elfscan::log;

int batch_result::exit_status() const noexcept
{
    return failed ? exit_target_failed : exit_success;
}

batch_result escan::introspect_all(const std::vector<cfg::target_t>& targets,
    const elfscan::tool& tool)
{
    batch_result retval;
    retval.objects.reserve(targets.size());
    for (const auto& target : targets)
    {
        const auto& obj = retval.objects.emplace_back(target.path, target.member, tool);
        if (obj.failed())
            retval.failed++;
        else
            log::logline(log::success, "%s: inspected", target.member.c_str());
    }
    if (retval.failed)
        log::logline(log::error, "%zu of %zu target(s) failed", retval.failed, targets.size());
    return retval;
}
