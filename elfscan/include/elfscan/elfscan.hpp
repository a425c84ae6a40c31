// elfscan.hpp

#pragma once

#include <elfscan/dynamic.hpp>
#include <elfscan/error.hpp>
#include <elfscan/log.hpp>
#include <elfscan/object_introspector.hpp>
#include <elfscan/program_headers.hpp>
#include <elfscan/result.hpp>
#include <elfscan/sections.hpp>
#include <elfscan/symbols.hpp>
#include <elfscan/text_scan.hpp>
#include <elfscan/tool.hpp>
