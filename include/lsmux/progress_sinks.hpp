#pragma once

#include "lsmux/progress.hpp"

namespace lsmux {

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace lsmux
