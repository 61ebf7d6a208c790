/***
 * Name: pyinfer::analysis::AnalysisUnit
 * Purpose: Unit of scheduling: "this scope's body needs re-evaluation".
 * Inputs: The owning session, the project entry (null for session-internal units), a scope
 *   and the module, class or function node whose body is evaluated.
 * Theory of Operation:
 *   Units are created by AnalysisSession::makeUnit and are shared: the session, the queue
 *   and every variable that recorded the unit as a reader hold it. A unit is retired when
 *   its tree is replaced or its module removed; a retired unit never enqueues and never
 *   runs, and it is destroyed once the last holder has dropped it.
 */
#pragma once

#include <atomic>
#include <memory>

#include "analysis/VariableDef.h"

namespace pyinfer::ast {
    struct Node;
}

namespace pyinfer::analysis {

    class AnalysisSession;
    class ProjectEntry;
    class Scope;

    class AnalysisUnit : public std::enable_shared_from_this<AnalysisUnit> {
    public:
        AnalysisUnit(AnalysisSession& session, ProjectEntry* entry, Scope& scope, const ast::Node& node)
            : session_(session), entry_(entry), scope_(scope), node_(node) {}
        AnalysisUnit(const AnalysisUnit&) = delete;
        AnalysisUnit& operator=(const AnalysisUnit&) = delete;

        AnalysisSession& session() const { return session_; }
        ProjectEntry* entry() const { return entry_; }
        Scope& scope() const { return scope_; }
        const ast::Node& node() const { return node_; }

        void enqueue(bool front = false);
        // Walk the body of the unit's node against its scope. The node is only read while
        // the unit is live.
        void analyze();

        bool isRetired() const { return retired_.load(); }
        void retire() { retired_.store(true); }

        EncodedLocation locationOf(const ast::Node& node) const;

    private:
        AnalysisSession& session_;
        ProjectEntry* entry_;
        Scope& scope_;
        const ast::Node& node_;
        std::atomic<bool> retired_{false};
    };

} // namespace pyinfer::analysis
