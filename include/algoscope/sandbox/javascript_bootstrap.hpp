/**
 * @file javascript_bootstrap.hpp
 * @brief Bootstrap program executed by the node interpreter for every run
 *
 * The bootstrap reads one request envelope from stdin:
 *
 * @code
 * { "code": "...", "input": <json|null>, "timeoutMs": 2000, "maxTraceRecords": 10000 }
 * @endcode
 *
 * builds a fresh vm context exposing only console, print, input and trace,
 * runs the user code and reports through three channels:
 *
 * - fd 1: console.log / console.info / console.debug / print lines
 * - fd 2: console.error / console.warn lines
 * - fd 3: NDJSON control records
 *
 * Control records:
 * @code
 * {"type":"trace","description":"...","array":[...]|null,"highlighted":[...]|null,"line":N}
 * {"type":"trace-truncated"}
 * {"type":"done","durationMs":1.25}
 * {"type":"fault","kind":"SyntaxError|RuntimeError|StackOverflow|Timeout|BootstrapError",
 *  "name":"TypeError","message":"..."}
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace algoscope {
namespace sandbox {

/// Descriptor number the bootstrap writes control records to
constexpr int kControlFd = 3;

/**
 * @brief Source text of the javascript bootstrap
 */
const std::string& JavascriptBootstrapSource();

} // namespace sandbox
} // namespace algoscope
