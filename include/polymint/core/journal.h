// POLYMINT - Call Journal
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// All-or-nothing execution for calls that touch several stateful
// collaborators. Each participant checkpoints on entry; the scope rolls
// every participant back unless the call commits.

#ifndef POLYMINT_CORE_JOURNAL_H
#define POLYMINT_CORE_JOURNAL_H

#include <initializer_list>
#include <vector>

namespace polymint {

/**
 * A stateful collaborator that can take nested checkpoints.
 */
class IJournaled {
public:
    virtual ~IJournaled() = default;

    /// Push a checkpoint of the current state
    virtual void Checkpoint() = 0;

    /// Restore the state saved by the matching Checkpoint() and pop it
    virtual void Rollback() = 0;

    /// Keep the current state and pop the matching checkpoint
    virtual void Release() = 0;
};

/**
 * RAII guard over the participants of one call.
 *
 * Null entries are skipped, and a participant listed twice is only
 * checkpointed once.
 */
class JournalScope {
public:
    explicit JournalScope(std::initializer_list<IJournaled*> participants);
    explicit JournalScope(const std::vector<IJournaled*>& participants);
    ~JournalScope();

    JournalScope(const JournalScope&) = delete;
    JournalScope& operator=(const JournalScope&) = delete;

    /// Keep all changes made since construction
    void Commit();

    bool IsCommitted() const { return committed_; }

private:
    void Enter(IJournaled* participant);

    std::vector<IJournaled*> participants_;
    bool committed_{false};
};

} // namespace polymint

#endif // POLYMINT_CORE_JOURNAL_H
