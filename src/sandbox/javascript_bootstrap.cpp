/**
 * @file javascript_bootstrap.cpp
 * @brief Javascript bootstrap source passed to `node -e`
 *
 * @date 2025
 */

#include "algoscope/sandbox/javascript_bootstrap.hpp"

namespace algoscope {
namespace sandbox {

namespace {

const char* const kBootstrapSource = R"JS(
'use strict';
const fs = require('fs');
const vm = require('vm');

const CONTROL_FD = 3;
const USER_FILENAME = 'user-code.js';

function emit(record) {
  fs.writeSync(CONTROL_FD, JSON.stringify(record) + '\n');
}

function formatValue(value) {
  if (typeof value === 'string') {
    return value;
  }
  try {
    const text = JSON.stringify(value);
    return text === undefined ? String(value) : text;
  } catch (e) {
    return String(value);
  }
}

function writeLine(fd, args) {
  fs.writeSync(fd, Array.prototype.map.call(args, formatValue).join(' ') + '\n');
}

function describeError(error) {
  if (error !== null && typeof error === 'object' && 'message' in error) {
    const name = typeof error.name === 'string' ? error.name : 'Error';
    return { name: name, message: String(error.message) };
  }
  return { name: 'Error', message: String(error) };
}

function callerLine() {
  const stack = String(new Error().stack || '');
  const match = /user-code\.js:(\d+)/.exec(stack);
  return match ? Number(match[1]) : 0;
}

let request;
try {
  request = JSON.parse(fs.readFileSync(0, 'utf8'));
} catch (e) {
  emit({ type: 'fault', kind: 'BootstrapError', name: 'Error', message: 'malformed request envelope' });
  process.exit(70);
}

const maxTraceRecords = Number(request.maxTraceRecords) || 0;
let traceCount = 0;

const out = function () { writeLine(1, arguments); };
const err = function () { writeLine(2, arguments); };

function toNumbers(values, integral) {
  if (!Array.isArray(values)) {
    return null;
  }
  const result = [];
  for (const value of values) {
    const n = Number(value);
    if (!Number.isFinite(n)) {
      return null;
    }
    result.push(integral ? Math.trunc(n) : n);
  }
  return result;
}

function trace(description, array, highlighted, line) {
  if (traceCount >= maxTraceRecords) {
    if (traceCount === maxTraceRecords) {
      emit({ type: 'trace-truncated' });
      traceCount++;
    }
    return;
  }
  traceCount++;
  emit({
    type: 'trace',
    description: formatValue(description),
    array: toNumbers(array, false),
    highlighted: toNumbers(highlighted, true),
    line: Number.isInteger(line) ? line : callerLine()
  });
}

const sandbox = Object.create(null);
sandbox.console = Object.freeze({ log: out, info: out, debug: out, error: err, warn: err });
sandbox.print = out;
sandbox.trace = trace;
sandbox.__algoscope_input = JSON.stringify(request.input === undefined ? null : request.input);

const context = vm.createContext(sandbox, {
  codeGeneration: { strings: false, wasm: false },
  microtaskMode: 'afterEvaluate'
});
vm.runInContext(
  'globalThis.input = JSON.parse(globalThis.__algoscope_input); delete globalThis.__algoscope_input;',
  context);

let script;
try {
  script = new vm.Script(String(request.code), { filename: USER_FILENAME });
} catch (e) {
  const info = describeError(e);
  emit({ type: 'fault', kind: 'SyntaxError', name: info.name, message: info.message });
  process.exit(65);
}

const started = process.hrtime.bigint();
try {
  script.runInContext(context, { timeout: Number(request.timeoutMs) || 1000, breakOnSigint: false });
} catch (e) {
  if (e !== null && typeof e === 'object' && e.code === 'ERR_SCRIPT_EXECUTION_TIMEOUT') {
    emit({ type: 'fault', kind: 'Timeout', name: 'TimeoutError', message: 'Script execution timed out' });
    process.exit(66);
  }
  const info = describeError(e);
  const kind = /Maximum call stack size exceeded/.test(info.message) ? 'StackOverflow' : 'RuntimeError';
  emit({ type: 'fault', kind: kind, name: info.name, message: info.message });
  process.exit(67);
}
const finished = process.hrtime.bigint();

emit({ type: 'done', durationMs: Number(finished - started) / 1e6 });
process.exit(0);
)JS";

} // namespace

const std::string& JavascriptBootstrapSource() {
    static const std::string source(kBootstrapSource);
    return source;
}

} // namespace sandbox
} // namespace algoscope
