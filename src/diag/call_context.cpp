//! # Call Context Capture Implementation
//!
//! Linux: backtrace() + dladdr() + abi::__cxa_demangle.

#include "diag/call_context.hpp"

#include "log/log.hpp"

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>

namespace jig::diag {

namespace {

thread_local std::string thread_name_override;

} // namespace

std::string demangle(const char* symbol) {
    if (!symbol) {
        return "";
    }

    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return symbol;
}

std::vector<StackFrame> capture_stack_trace(size_t skip, size_t max_depth) {
    max_depth = std::min(max_depth, MAX_STACK_DEPTH);

    // One extra slot for this function's own frame.
    void* addresses[MAX_STACK_DEPTH + 1];
    size_t wanted = std::min(max_depth + skip + 1, MAX_STACK_DEPTH + 1);
    int captured = ::backtrace(addresses, static_cast<int>(wanted));

    std::vector<StackFrame> frames;
    for (int i = static_cast<int>(skip) + 1; i < captured && frames.size() < max_depth; ++i) {
        StackFrame frame;
        frame.address = reinterpret_cast<uintptr_t>(addresses[i]);

        Dl_info info{};
        if (dladdr(addresses[i], &info) != 0) {
            if (info.dli_fname) {
                frame.module = info.dli_fname;
            }
            if (info.dli_sname) {
                frame.symbol = demangle(info.dli_sname);
                frame.offset = frame.address - reinterpret_cast<uintptr_t>(info.dli_saddr);
            } else {
                frame.offset = frame.address - reinterpret_cast<uintptr_t>(info.dli_fbase);
            }
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

std::string format_stack_trace(const std::vector<StackFrame>& frames) {
    std::ostringstream oss;
    for (const auto& frame : frames) {
        oss << "\n\tat ";
        if (!frame.symbol.empty()) {
            oss << frame.symbol << "+0x" << std::hex << frame.offset << std::dec;
        } else {
            oss << "0x" << std::hex << frame.address << std::dec;
        }
        if (!frame.module.empty()) {
            oss << " (" << frame.module << ")";
        }
    }
    return oss.str();
}

uint64_t current_thread_id() {
    return static_cast<uint64_t>(::syscall(SYS_gettid));
}

std::string current_thread_name() {
    if (!thread_name_override.empty()) {
        return thread_name_override;
    }

    char buffer[64] = {};
    if (pthread_getname_np(pthread_self(), buffer, sizeof(buffer)) == 0 && buffer[0] != '\0') {
        return buffer;
    }
    return "thread-" + std::to_string(current_thread_id());
}

void set_current_thread_name(std::string_view name) {
    thread_name_override = std::string(name);

    // The kernel limits names to 15 characters plus the terminator.
    std::string truncated(name.substr(0, 15));
    if (int rc = pthread_setname_np(pthread_self(), truncated.c_str()); rc != 0) {
        JIG_LOG_DEBUG("diag", "Could not set OS thread name " << truncated << " (error " << rc
                                                               << ")");
    }
}

} // namespace jig::diag
