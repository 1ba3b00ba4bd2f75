// POLYMINT - Call Journal Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/core/journal.h"

#include <algorithm>

namespace polymint {

JournalScope::JournalScope(std::initializer_list<IJournaled*> participants) {
    for (IJournaled* p : participants) {
        Enter(p);
    }
}

JournalScope::JournalScope(const std::vector<IJournaled*>& participants) {
    for (IJournaled* p : participants) {
        Enter(p);
    }
}

JournalScope::~JournalScope() {
    if (committed_) {
        return;
    }
    // Unwind in reverse order of entry
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        (*it)->Rollback();
    }
}

void JournalScope::Enter(IJournaled* participant) {
    if (participant == nullptr) {
        return;
    }
    if (std::find(participants_.begin(), participants_.end(), participant) != participants_.end()) {
        return;
    }
    participant->Checkpoint();
    participants_.push_back(participant);
}

void JournalScope::Commit() {
    if (committed_) {
        return;
    }
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        (*it)->Release();
    }
    committed_ = true;
}

} // namespace polymint
