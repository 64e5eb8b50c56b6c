// =============================================================================
// TabFold — ShellWindowsAutomation
// IShellWindows / IWebBrowser2 access on a private STA thread.
//
// Location lookup uses typed interfaces only:
//   IWebBrowser2::get_LocationURL
//   IWebBrowser2::get_Document -> IShellFolderViewDual::get_Folder
//       -> Folder2::get_Self -> FolderItem::get_Path
// Window lookup: IServiceProvider::QueryService(SID_STopLevelBrowser)
//       -> IShellBrowser::GetWindow  (the tab's ShellTabWindowClass)
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif

#include <windows.h>
#include <exdisp.h>
#include <exdispid.h>
#include <ocidl.h>
#include <shldisp.h>
#include <shlobj.h>
#include <shlguid.h>
#include <servprov.h>
#include <wrl/client.h>

#pragma comment(lib, "Ole32.lib")
#pragma comment(lib, "OleAut32.lib")
#pragma comment(lib, "Uuid.lib")

#include "tabfold/output/ShellWindowsAutomation.h"
#include "tabfold/common/AppMessages.h"
#include "tabfold/common/ShellConstants.h"
#include "tabfold/logic/PathRules.h"
#include "tabfold/support/Log.h"

#include <exception>
#include <future>
#include <stdexcept>
#include <mutex>
#include <thread>

using Microsoft::WRL::ComPtr;

namespace TabFold
{

namespace
{

// ─── Automation object ──────────────────────────────────────────────────────

class BrowserObject : public AutomationObject
{
public:
    explicit BrowserObject(ComPtr<IWebBrowser2> browser) : browser_(std::move(browser)) {}
    IWebBrowser2* get() const { return browser_.Get(); }

private:
    ComPtr<IWebBrowser2> browser_;
};

IWebBrowser2* browserOf(const AutomationObject& obj)
{
    return static_cast<const BrowserObject&>(obj).get();
}

// Owns a BSTR for the duration of a call
class ScopedBstr
{
public:
    explicit ScopedBstr(const std::wstring& text) : value_(SysAllocString(text.c_str())) {}
    ScopedBstr() = default;
    ~ScopedBstr() { SysFreeString(value_); }
    ScopedBstr(const ScopedBstr&) = delete;
    ScopedBstr& operator=(const ScopedBstr&) = delete;

    BSTR* out() { return &value_; }
    BSTR get() const { return value_; }
    std::wstring str() const { return value_ ? std::wstring(value_, SysStringLen(value_)) : std::wstring(); }

private:
    BSTR value_ = nullptr;
};

bool isShellProcessBrowser(IWebBrowser2* browser)
{
    ScopedBstr fullName;
    if (FAILED(browser->get_FullName(fullName.out())) || !fullName.get())
        return false;

    std::wstring image = fullName.str();
    const size_t slash = image.find_last_of(L"\\/");
    if (slash != std::wstring::npos)
        image = image.substr(slash + 1);
    return PathRules::equalsIgnoreCase(PathRules::normalizeExeName(image), kShellProcessName);
}

// ─── Registration sink ──────────────────────────────────────────────────────
// DShellWindowsEvents dispinterface: WindowRegistered(long cookie),
// WindowRevoked(long cookie). Only the former is of interest.

class ShellWindowsEvents : public IDispatch
{
public:
    explicit ShellWindowsEvents(ShellAutomation::RegisteredCallback onRegistered)
        : refCount_(1), onRegistered_(std::move(onRegistered))
    {
    }

    // IUnknown
    IFACEMETHODIMP QueryInterface(REFIID riid, void** object) override
    {
        if (!object)
            return E_POINTER;
        if (riid == IID_IUnknown || riid == IID_IDispatch || riid == DIID_DShellWindowsEvents)
        {
            *object = static_cast<IDispatch*>(this);
            AddRef();
            return S_OK;
        }
        *object = nullptr;
        return E_NOINTERFACE;
    }

    IFACEMETHODIMP_(ULONG) AddRef() override
    {
        return static_cast<ULONG>(++refCount_);
    }

    IFACEMETHODIMP_(ULONG) Release() override
    {
        const ULONG count = static_cast<ULONG>(--refCount_);
        if (count == 0)
            delete this;
        return count;
    }

    // IDispatch: late-bound calls only arrive through Invoke
    IFACEMETHODIMP GetTypeInfoCount(UINT* pctinfo) override
    {
        if (!pctinfo)
            return E_POINTER;
        *pctinfo = 0;
        return S_OK;
    }

    IFACEMETHODIMP GetTypeInfo(UINT, LCID, ITypeInfo**) override { return E_NOTIMPL; }

    IFACEMETHODIMP GetIDsOfNames(REFIID, LPOLESTR*, UINT, LCID, DISPID*) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP Invoke(DISPID dispIdMember, REFIID, LCID, WORD, DISPPARAMS* params,
                          VARIANT*, EXCEPINFO*, UINT*) override
    {
        if (dispIdMember != DISPID_WINDOWREGISTERED || !params || params->cArgs < 1)
            return S_OK;

        VARIANT cookie;
        VariantInit(&cookie);
        if (SUCCEEDED(VariantChangeType(&cookie, &params->rgvarg[0], 0, VT_I4)))
        {
            try
            {
                onRegistered_(cookie.lVal);
            }
            catch (const std::exception& ex)
            {
                Log::error(L"registration callback threw: %ls", Log::widen(ex.what()).c_str());
            }
        }
        VariantClear(&cookie);
        return S_OK;
    }

private:
    std::atomic<long> refCount_;
    ShellAutomation::RegisteredCallback onRegistered_;
};

} // namespace

// ─── Impl ───────────────────────────────────────────────────────────────────

struct ShellWindowsAutomation::Impl
{
    std::thread apartment;
    DWORD apartmentThreadId = 0;
    HWND messageWindow = nullptr;

    ComPtr<IShellWindows> shellWindows;
    DWORD shellWindowsThreadId = 0;

    ComPtr<IConnectionPoint> connectionPoint;
    DWORD adviseCookie = 0;

    // Collection pointer bound to the calling thread; recreated on mismatch
    IShellWindows* collection()
    {
        const DWORD current = GetCurrentThreadId();
        if (shellWindows && shellWindowsThreadId == current)
            return shellWindows.Get();

        shellWindows.Reset();
        HRESULT hr = CoCreateInstance(CLSID_ShellWindows, nullptr, CLSCTX_ALL,
                                      IID_PPV_ARGS(&shellWindows));
        if (FAILED(hr))
        {
            Log::warn(L"CoCreateInstance(ShellWindows) failed: 0x%08lx", static_cast<unsigned long>(hr));
            return nullptr;
        }
        shellWindowsThreadId = current;
        return shellWindows.Get();
    }

    static LRESULT CALLBACK windowProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
    {
        if (msg == WM_APARTMENT_INVOKE)
        {
            auto* task = reinterpret_cast<std::packaged_task<void()>*>(lParam);
            (*task)();
            return 0;
        }
        return DefWindowProcW(hwnd, msg, wParam, lParam);
    }

    void threadMain(std::promise<bool>& ready)
    {
        apartmentThreadId = GetCurrentThreadId();

        HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        if (FAILED(hr))
        {
            Log::error(L"CoInitializeEx failed: 0x%08lx", static_cast<unsigned long>(hr));
            ready.set_value(false);
            return;
        }

        WNDCLASSEXW wc = {};
        wc.cbSize = sizeof(wc);
        wc.lpfnWndProc = windowProc;
        wc.hInstance = GetModuleHandleW(nullptr);
        wc.lpszClassName = L"TabFoldApartment";
        RegisterClassExW(&wc);

        messageWindow = CreateWindowExW(0, wc.lpszClassName, L"", 0, 0, 0, 0, 0,
                                        HWND_MESSAGE, nullptr, wc.hInstance, nullptr);
        if (!messageWindow || !collection())
        {
            if (messageWindow)
                DestroyWindow(messageWindow);
            messageWindow = nullptr;
            CoUninitialize();
            ready.set_value(false);
            return;
        }
        ready.set_value(true);

        MSG msg;
        while (GetMessageW(&msg, nullptr, 0, 0) > 0)
        {
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }

        // Cleanup: all COM references released on their own thread
        if (connectionPoint)
        {
            connectionPoint->Unadvise(adviseCookie);
            connectionPoint.Reset();
        }
        shellWindows.Reset();
        DestroyWindow(messageWindow);
        messageWindow = nullptr;
        CoUninitialize();
    }
};

// ─── Lifecycle ──────────────────────────────────────────────────────────────

ShellWindowsAutomation::~ShellWindowsAutomation()
{
    stop();
}

bool ShellWindowsAutomation::start()
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    impl_ = new Impl();
    std::promise<bool> ready;
    std::future<bool> started = ready.get_future();
    impl_->apartment = std::thread([this, &ready]() { impl_->threadMain(ready); });

    if (!started.get())
    {
        impl_->apartment.join();
        delete impl_;
        impl_ = nullptr;
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void ShellWindowsAutomation::stop()
{
    if (!running_.load(std::memory_order_acquire))
        return;

    if (impl_)
    {
        PostThreadMessageW(impl_->apartmentThreadId, WM_QUIT, 0, 0);
        if (impl_->apartment.joinable())
            impl_->apartment.join();
        delete impl_;
        impl_ = nullptr;
    }

    running_.store(false, std::memory_order_release);
}

void ShellWindowsAutomation::invokeOnApartment(const std::function<void()>& fn)
{
    if (!impl_ || GetCurrentThreadId() == impl_->apartmentThreadId)
    {
        fn();
        return;
    }

    std::packaged_task<void()> task(fn);
    std::future<void> done = task.get_future();
    if (!PostMessageW(impl_->messageWindow, WM_APARTMENT_INVOKE, 0, reinterpret_cast<LPARAM>(&task)))
        throw std::runtime_error("apartment thread is not accepting work");

    // Rethrows anything `fn` threw
    done.get();
}

// ─── Collection ─────────────────────────────────────────────────────────────

std::vector<AutomationObjectPtr> ShellWindowsAutomation::enumerate()
{
    std::vector<AutomationObjectPtr> result;
    IShellWindows* windows = impl_ ? impl_->collection() : nullptr;
    if (!windows)
        return result;

    long count = 0;
    if (FAILED(windows->get_Count(&count)))
        return result;

    for (long i = 0; i < count; ++i)
    {
        auto obj = item(i);
        if (obj && isShellProcessBrowser(browserOf(*obj)))
            result.push_back(std::move(obj));
    }
    return result;
}

AutomationObjectPtr ShellWindowsAutomation::item(long index)
{
    IShellWindows* windows = impl_ ? impl_->collection() : nullptr;
    if (!windows)
        return nullptr;

    VARIANT v;
    VariantInit(&v);
    v.vt = VT_I4;
    v.lVal = index;

    ComPtr<IDispatch> dispatch;
    if (FAILED(windows->Item(v, &dispatch)) || !dispatch)
        return nullptr;

    ComPtr<IWebBrowser2> browser;
    if (FAILED(dispatch.As(&browser)))
        return nullptr;
    return std::make_unique<BrowserObject>(std::move(browser));
}

// ─── Per-object queries ─────────────────────────────────────────────────────

std::optional<std::wstring> ShellWindowsAutomation::locationUrl(const AutomationObject& obj)
{
    ScopedBstr url;
    if (FAILED(browserOf(obj)->get_LocationURL(url.out())) || !url.get())
        return std::nullopt;
    return url.str();
}

std::optional<std::wstring> ShellWindowsAutomation::folderSelfPath(const AutomationObject& obj)
{
    ComPtr<IDispatch> document;
    if (FAILED(browserOf(obj)->get_Document(&document)) || !document)
        return std::nullopt;

    ComPtr<IShellFolderViewDual> view;
    if (FAILED(document.As(&view)))
        return std::nullopt;

    ComPtr<Folder> folder;
    if (FAILED(view->get_Folder(&folder)) || !folder)
        return std::nullopt;

    ComPtr<Folder2> folder2;
    if (FAILED(folder.As(&folder2)))
        return std::nullopt;

    ComPtr<FolderItem> self;
    if (FAILED(folder2->get_Self(&self)) || !self)
        return std::nullopt;

    ScopedBstr path;
    if (FAILED(self->get_Path(path.out())) || !path.get())
        return std::nullopt;
    return path.str();
}

WindowHandle ShellWindowsAutomation::hostWindow(const AutomationObject& obj)
{
    ComPtr<IServiceProvider> provider;
    if (FAILED(browserOf(obj)->QueryInterface(IID_PPV_ARGS(&provider))))
        return kNullWindow;

    ComPtr<IShellBrowser> shellBrowser;
    if (FAILED(provider->QueryService(SID_STopLevelBrowser, IID_PPV_ARGS(&shellBrowser))))
        return kNullWindow;

    HWND hwnd = nullptr;
    if (FAILED(shellBrowser->GetWindow(&hwnd)))
        return kNullWindow;
    return reinterpret_cast<WindowHandle>(hwnd);
}

WindowHandle ShellWindowsAutomation::topLevelWindow(const AutomationObject& obj)
{
    SHANDLE_PTR hwnd = 0;
    if (FAILED(browserOf(obj)->get_HWND(&hwnd)))
        return kNullWindow;
    return static_cast<WindowHandle>(hwnd);
}

// ─── Navigation ─────────────────────────────────────────────────────────────

bool ShellWindowsAutomation::navigate(const AutomationObject& obj, const std::wstring& location)
{
    ScopedBstr target(location);
    VARIANT url;
    VariantInit(&url);
    url.vt = VT_BSTR;
    url.bstrVal = target.get();

    VARIANT empty;
    VariantInit(&empty);
    const HRESULT hr = browserOf(obj)->Navigate2(&url, &empty, &empty, &empty, &empty);
    if (FAILED(hr))
        Log::verbose(L"Navigate2 failed: 0x%08lx", static_cast<unsigned long>(hr));
    return SUCCEEDED(hr);
}

bool ShellWindowsAutomation::navigateViaNamespace(const AutomationObject& obj,
                                                  const std::wstring& location)
{
    ComPtr<IShellDispatch> shell;
    if (FAILED(CoCreateInstance(CLSID_Shell, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&shell))))
        return false;

    ScopedBstr path(location);
    VARIANT dir;
    VariantInit(&dir);
    dir.vt = VT_BSTR;
    dir.bstrVal = path.get();

    ComPtr<Folder> folder;
    if (FAILED(shell->NameSpace(dir, &folder)) || !folder)
        return navigate(obj, location);

    VARIANT target;
    VariantInit(&target);
    target.vt = VT_DISPATCH;
    target.pdispVal = folder.Get();

    VARIANT empty;
    VariantInit(&empty);
    return SUCCEEDED(browserOf(obj)->Navigate2(&target, &empty, &empty, &empty, &empty));
}

// ─── Registration channel ───────────────────────────────────────────────────

bool ShellWindowsAutomation::subscribeRegistrations(RegisteredCallback onRegistered)
{
    bool hooked = false;
    invokeOnApartment([&]() {
        IShellWindows* windows = impl_ ? impl_->collection() : nullptr;
        if (!windows || impl_->connectionPoint)
            return;

        ComPtr<IConnectionPointContainer> container;
        if (FAILED(windows->QueryInterface(IID_PPV_ARGS(&container))))
            return;

        ComPtr<IConnectionPoint> point;
        if (FAILED(container->FindConnectionPoint(DIID_DShellWindowsEvents, &point)))
            return;

        auto* sink = new ShellWindowsEvents(std::move(onRegistered));
        DWORD cookie = 0;
        const HRESULT hr = point->Advise(sink, &cookie);
        sink->Release(); // the connection point holds its own reference
        if (FAILED(hr))
        {
            Log::warn(L"DShellWindowsEvents Advise failed: 0x%08lx", static_cast<unsigned long>(hr));
            return;
        }

        impl_->connectionPoint = point;
        impl_->adviseCookie = cookie;
        hooked = true;
    });
    return hooked;
}

void ShellWindowsAutomation::unsubscribeRegistrations()
{
    invokeOnApartment([&]() {
        if (impl_ && impl_->connectionPoint)
        {
            impl_->connectionPoint->Unadvise(impl_->adviseCookie);
            impl_->connectionPoint.Reset();
            impl_->adviseCookie = 0;
        }
    });
}

} // namespace TabFold
