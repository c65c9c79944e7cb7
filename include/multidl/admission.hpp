#pragma once

#include "multidl/source_id.hpp"
#include <array>
#include <optional>

namespace multidl {

enum class Admission { Admitted, GlobalLimit, PerSourceLimit };

constexpr const char* kSkipUnsupported = "unsupported";
constexpr const char* kSkipGlobalLimit = "global-limit";
constexpr const char* kSkipPerSourceLimit = "per-source-limit";

inline const char* admissionReason(Admission a) {
    switch (a) {
        case Admission::GlobalLimit: return kSkipGlobalLimit;
        case Admission::PerSourceLimit: return kSkipPerSourceLimit;
        default: return "";
    }
}

// Per-batch counters. The global limit is checked before the per-source one;
// only admitted items are charged.
class AdmissionControl {
public:
    AdmissionControl(std::optional<int> globalLimit, std::optional<int> perSourceLimit)
        : globalLimit_(globalLimit), perSourceLimit_(perSourceLimit) {}

    Admission tryAdmit(SourceId source) {
        if (globalLimit_ && attempted_ >= *globalLimit_) return Admission::GlobalLimit;
        int& perSource = perSource_[sourceIndex(source)];
        if (perSourceLimit_ && perSource >= *perSourceLimit_) return Admission::PerSourceLimit;
        attempted_++;
        perSource++;
        return Admission::Admitted;
    }

    int attempted() const { return attempted_; }
    int attemptedFor(SourceId source) const { return perSource_[sourceIndex(source)]; }

private:
    std::optional<int> globalLimit_;
    std::optional<int> perSourceLimit_;
    int attempted_{0};
    std::array<int, kSourceCount> perSource_{};
};

} // namespace multidl
