#pragma once

#include <string>

namespace devproxy {
namespace testing {

// Defined by each server-backed test binary. Runs once, before the app starts.
void registerRoutes();

// http://127.0.0.1:<port><path> on the loopback listener the tests run against.
std::string localUrl(const std::string &path);

} // namespace testing
} // namespace devproxy
