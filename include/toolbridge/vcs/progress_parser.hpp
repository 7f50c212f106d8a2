/*
 * git progress line recognition - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/task/progress.hpp>

namespace toolbridge {

// "Receiving objects:  42% (1234/5678)" -> Percentage("Receiving objects", 42)
// "Enumerating objects: 123, done."     -> Phase("Enumerating objects")
// "remote: ..."                         -> the rest parsed again
// "From ...", "* ...", " + ...", " = ..." and anything else -> Message
// Percentages are per phase, so no overall fraction is reported.
class GitProgressParser : public ProgressParser {
public:
    std::optional<ProgressUpdate> parse(const std::string& line) const override;
    // Collapses whitespace; empty becomes "(unknown)".
    static std::string normalize_phase(const std::string& phase);
};

} // namespace toolbridge
