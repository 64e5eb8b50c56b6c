// =============================================================================
// TabFold — CandidateClassifier
// =============================================================================

#include "tabfold/logic/CandidateClassifier.h"
#include "tabfold/logic/PathRules.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/output/WindowBridge.h"

namespace TabFold
{

CandidateClassifier::CandidateClassifier(const WindowBridge& windows)
    : windows_(windows)
{
}

bool CandidateClassifier::hasTopLevelClass(WindowHandle h) const
{
    if (h == kNullWindow)
        return false;
    return PathRules::equalsIgnoreCase(windows_.className(h), kShellTopLevelClass);
}

bool CandidateClassifier::isTopLevelTarget(WindowHandle h) const
{
    if (h == kNullWindow || !windows_.isWindow(h))
        return false;

    if (!hasTopLevelClass(h))
        return false;

    const std::wstring image = PathRules::normalizeExeName(windows_.processImageName(h));
    return PathRules::equalsIgnoreCase(image, kShellProcessName);
}

bool CandidateClassifier::isUsableTarget(WindowHandle h) const
{
    if (h == kNullWindow || !windows_.isWindow(h))
        return false;
    if (!windows_.isVisible(h) || windows_.isMinimized(h))
        return false;
    return isTopLevelTarget(h);
}

std::vector<WindowHandle> CandidateClassifier::topLevelTargets(bool includeInvisible) const
{
    std::vector<WindowHandle> result;
    for (WindowHandle h : windows_.topLevelWindows(includeInvisible))
    {
        if (isTopLevelTarget(h))
            result.push_back(h);
    }
    return result;
}

std::vector<WindowHandle> CandidateClassifier::tabsOf(WindowHandle topLevel) const
{
    if (topLevel == kNullWindow)
        return {};
    return windows_.childrenOfClass(topLevel, kShellTabClass);
}

WindowHandle CandidateClassifier::activeTabOf(WindowHandle topLevel) const
{
    auto tabs = tabsOf(topLevel);
    return tabs.empty() ? kNullWindow : tabs.front();
}

} // namespace TabFold
