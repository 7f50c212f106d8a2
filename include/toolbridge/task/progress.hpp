/*
 * Progress recognition interface - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace toolbridge {

struct ProgressUpdate {
    enum class Kind { Message, Phase, Percentage };
    Kind kind = Kind::Message;
    std::string phase;
    std::string text;
    std::optional<int> percent;   // Percentage only, 0..100
    std::optional<double> fraction; // overall completion when the line states it
};

// Recognizes progress markers in one line of tool output.
class ProgressParser {
public:
    virtual ~ProgressParser() = default;
    virtual std::optional<ProgressUpdate> parse(const std::string& line) const = 0;
};

} // namespace toolbridge
