#pragma once
// =============================================================================
// TabFold — CandidateClassifier
// Narrows observed handles to genuine top-level windows of the target shell
// (window class + owning process image), and reads their tab children.
// =============================================================================

#include "tabfold/common/Types.h"

#include <vector>

namespace TabFold
{

class WindowBridge;

class CandidateClassifier
{
public:
    explicit CandidateClassifier(const WindowBridge& windows);

    // Class matches the shell's top-level class AND the owning process image
    // (extension stripped, case-insensitive) matches the shell process.
    bool isTopLevelTarget(WindowHandle h) const;

    // Class check only: cheap enough for the object-create callback.
    bool hasTopLevelClass(WindowHandle h) const;

    // Alive, visible, not minimised, and a top-level target.
    bool isUsableTarget(WindowHandle h) const;

    std::vector<WindowHandle> topLevelTargets(bool includeInvisible) const;

    // Tab children in z-order; the first is the active tab.
    std::vector<WindowHandle> tabsOf(WindowHandle topLevel) const;
    WindowHandle activeTabOf(WindowHandle topLevel) const;

private:
    const WindowBridge& windows_;
};

} // namespace TabFold
