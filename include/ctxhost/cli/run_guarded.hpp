#pragma once
#include <functional>

namespace ctxhost::cli
{

/// Run a command body and turn any escaping exception into a logged failure.
/// Returns the body's exit code, or 1 if it threw.
int run_guarded(const std::function<int()>& body);

} // namespace ctxhost::cli
