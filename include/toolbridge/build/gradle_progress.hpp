/*
 * Gradle console progress recognition - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/task/progress.hpp>

namespace toolbridge {

// "<===---> 42% EXECUTING [3s]" -> Percentage("EXECUTING", 42), fraction 0.42
// "> Task :app:compileJava"     -> Message
// "BUILD SUCCESSFUL in 2s"      -> Message, fraction 1.0
// "BUILD FAILED"                -> Message
// ANSI escape sequences of the rich console are ignored.
class GradleProgressParser : public ProgressParser {
public:
    std::optional<ProgressUpdate> parse(const std::string& line) const override;
    static std::string strip_ansi(const std::string& s);
};

} // namespace toolbridge
