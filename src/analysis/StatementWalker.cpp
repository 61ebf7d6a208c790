/***
 * Name: StatementWalker (definitions)
 * Purpose: Evaluate the statements of one unit body, flow-insensitively.
 * Theory of Operation:
 *   Both branches of every conditional and loop are walked. Assignments join into the
 *   target variables; a definition creates its value once per node and queues its own
 *   unit at the front. Imports consult the project module table before the host. Names
 *   bound at module level are reachable from other modules as module members.
 */
#include "analysis/StatementWalker.h"

#include "analysis/AnalysisSession.h"
#include "analysis/AnalysisUnit.h"
#include "analysis/ModuleLike.h"
#include "analysis/ProjectEntry.h"
#include "analysis/Scope.h"
#include "analysis/values/ClassInfo.h"
#include "analysis/values/FunctionInfo.h"
#include "analysis/values/ModuleInfo.h"

namespace pyinfer::analysis {

    /*** Name: StatementWalker::walkUnitBody */
    void StatementWalker::walkUnitBody() {
        const ast::Node& node = unit_.node();
        switch (node.kind) {
            case ast::NodeKind::Module: walk(static_cast<const ast::Module&>(node).body); break;
            case ast::NodeKind::FunctionDef: walk(static_cast<const ast::FunctionDef&>(node).body); break;
            case ast::NodeKind::ClassDef: walk(static_cast<const ast::ClassDef&>(node).body); break;
            default: break;
        }
    }

    void StatementWalker::walk(const std::vector<std::unique_ptr<ast::Stmt>>& body) {
        for (const auto& statement : body) {
            if (statement) { statement->accept(*this); }
        }
    }

    void StatementWalker::bind(const ast::Node& node, const std::string& name, const NamespaceSet& values) {
        VariableDef& variable = unit_.scope().createVariable(name);
        variable.addAssignment(unit_.locationOf(node));
        variable.addTypes(values);
    }

    ModuleLike* StatementWalker::enclosingModule() const {
        ProjectEntry* entry = unit_.entry();
        return entry != nullptr ? &entry->module() : nullptr;
    }

    std::string StatementWalker::qualifiedName(const std::string& name) const {
        const Scope& scope = unit_.scope();
        if (scope.kind() == ScopeKind::Class && scope.owner() != nullptr) { return scope.owner()->name() + "." + name; }
        return name;
    }

    /*** Name: StatementWalker::visit(FunctionDef) */
    void StatementWalker::visit(const ast::FunctionDef& node) {
        AnalysisSession& session = unit_.session();
        Scope& scope = unit_.scope();
        bool created = false;
        const NamespaceSet values = scope.getOrMakeNodeValue(node, [&] {
            created = true;
            return session.make<FunctionInfo>(session, unit_.entry(), node, scope)->selfSet();
        });
        const std::vector<FunctionInfo*> functions = values.ofType<FunctionInfo>();
        if (functions.empty()) { return; }
        FunctionInfo& function = *functions.front();

        for (std::size_t i = 0; i < node.params.size(); ++i) {
            if (node.params[i].defaultValue) {
                function.parameter(i)->addTypes(eval_.evaluate(node.params[i].defaultValue.get()));
            }
        }
        for (const auto& decorator : node.decorators) { eval_.evaluate(decorator.get()); }

        NamespaceSet bound = function.selfSet();
        bool analyzeBody = true;
        if (ModuleLike* module = enclosingModule()) {
            const std::string qualified = qualifiedName(node.name);
            if (const auto entry = module->specialization(qualified)) {
                bound = function.specialized(*module, qualified).selfSet();
                analyzeBody = entry->analyze;
            }
        }
        bind(node, node.name, bound);
        if (!created || !analyzeBody) { return; }
        if (AnalysisUnit* body = function.unit()) { body->enqueue(true); }
    }

    /*** Name: StatementWalker::visit(ClassDef) */
    void StatementWalker::visit(const ast::ClassDef& node) {
        AnalysisSession& session = unit_.session();
        Scope& scope = unit_.scope();
        bool created = false;
        const NamespaceSet values = scope.getOrMakeNodeValue(node, [&] {
            created = true;
            return session.make<ClassInfo>(session, unit_.entry(), node, scope)->selfSet();
        });
        const std::vector<ClassInfo*> classes = values.ofType<ClassInfo>();
        if (classes.empty()) { return; }
        ClassInfo& cls = *classes.front();

        for (const auto& base : node.bases) { cls.bases().addTypes(eval_.evaluate(base.get())); }
        bind(node, node.name, cls.selfSet());
        if (!created) { return; }
        if (AnalysisUnit* body = cls.unit()) { body->enqueue(true); }
    }

    /*** Name: StatementWalker::visit(ReturnStmt) */
    void StatementWalker::visit(const ast::ReturnStmt& node) {
        Scope& scope = unit_.scope();
        if (scope.kind() != ScopeKind::Function || scope.owner() == nullptr) { return; }
        auto* function = static_cast<FunctionInfo*>(scope.owner());
        const NamespaceSet values =
            node.value ? eval_.evaluate(node.value.get()) : unit_.session().noneConstant()->selfSet();
        function->returnValue().addTypes(values);
    }

    void StatementWalker::visit(const ast::AssignStmt& node) {
        const NamespaceSet values = eval_.evaluate(node.value.get());
        for (const auto& target : node.targets) { assign(node, target.get(), values); }
    }

    void StatementWalker::visit(const ast::ExprStmt& node) { eval_.evaluate(node.value.get()); }

    void StatementWalker::visit(const ast::IfStmt& node) {
        eval_.evaluate(node.cond.get());
        walk(node.thenBody);
        walk(node.elseBody);
    }

    void StatementWalker::visit(const ast::WhileStmt& node) {
        eval_.evaluate(node.cond.get());
        walk(node.thenBody);
        walk(node.elseBody);
    }

    void StatementWalker::visit(const ast::ForStmt& node) {
        const NamespaceSet iterable = eval_.evaluate(node.iterable.get());
        assign(node, node.target.get(), analysis::getEnumeratorTypes(iterable, node, unit_));
        walk(node.thenBody);
        walk(node.elseBody);
    }

    /*** Name: StatementWalker::assign */
    void StatementWalker::assign(const ast::Node& statement, const ast::Expr* target, const NamespaceSet& values) {
        if (target == nullptr) { return; }
        switch (target->kind) {
            case ast::NodeKind::Name:
                bind(*target, static_cast<const ast::Name*>(target)->id, values);
                break;
            case ast::NodeKind::Attribute: {
                const auto* attribute = static_cast<const ast::Attribute*>(target);
                for (Namespace* object : eval_.evaluate(attribute->value.get())) {
                    object->setMember(statement, unit_, attribute->attr, values);
                }
                break;
            }
            case ast::NodeKind::Subscript: {
                const auto* subscript = static_cast<const ast::Subscript*>(target);
                const NamespaceSet index = eval_.evaluate(subscript->slice.get());
                for (Namespace* object : eval_.evaluate(subscript->value.get())) {
                    object->setIndex(statement, unit_, index, values);
                }
                break;
            }
            case ast::NodeKind::TupleLiteral:
            case ast::NodeKind::ListLiteral: {
                const auto& elements = target->kind == ast::NodeKind::TupleLiteral
                                           ? static_cast<const ast::TupleLiteral*>(target)->elements
                                           : static_cast<const ast::ListLiteral*>(target)->elements;
                const NamespaceSet items = analysis::getEnumeratorTypes(values, *target, unit_);
                for (const auto& element : elements) { assign(statement, element.get(), items); }
                break;
            }
            default:
                break;
        }
    }

    /*** Name: StatementWalker::resolveModule */
    Namespace* StatementWalker::resolveModule(const std::string& name) {
        AnalysisSession& session = unit_.session();
        if (name.empty()) { return nullptr; }
        auto ref = session.modules().tryGetValue(name);
        if (ref && ref->hasModule()) { return ref->module(); }
        if (Namespace* module = session.importer().importBuiltinModule(name)) { return module; }
        session.watchModuleName(name, unit_);
        return nullptr;
    }

    /*** Name: StatementWalker::visit(Import) */
    void StatementWalker::visit(const ast::Import& node) {
        for (const ast::Alias& alias : node.names) {
            Namespace* module = resolveModule(alias.name);
            if (!alias.asname.empty()) {
                bind(node, alias.asname, NamespaceSet(module));
                continue;
            }
            // `import a.b` binds `a`.
            const std::string top = alias.name.substr(0, alias.name.find('.'));
            bind(node, top, NamespaceSet(top == alias.name ? module : resolveModule(top)));
        }
    }

    std::string StatementWalker::relativeBase(const ast::ImportFrom& node) const {
        ProjectEntry* entry = unit_.entry();
        if (entry == nullptr) { return node.module; }
        std::string package = entry->moduleName();
        const auto dropLast = [&package] {
            const auto dot = package.rfind('.');
            package = dot == std::string::npos ? std::string() : package.substr(0, dot);
        };
        if (!entry->isPackage()) { dropLast(); }
        for (int level = 1; level < node.level; ++level) { dropLast(); }
        if (node.module.empty()) { return package; }
        return package.empty() ? node.module : package + "." + node.module;
    }

    /*** Name: StatementWalker::visit(ImportFrom) */
    void StatementWalker::visit(const ast::ImportFrom& node) {
        const std::string base = node.level > 0 ? relativeBase(node) : node.module;
        Namespace* module = resolveModule(base);
        for (const ast::Alias& alias : node.names) {
            if (alias.name == "*") {
                if (module == nullptr) { continue; }
                for (const auto& member : module->allMembers()) {
                    if (member.first.empty() || member.first.front() == '_') { continue; }
                    bind(node, member.first, module->getMember(node, unit_, member.first));
                }
                continue;
            }
            NamespaceSet values = module != nullptr ? module->getMember(node, unit_, alias.name) : NamespaceSet{};
            if (values.empty()) {
                // `from pkg import sub` where sub is a module of its own.
                values = NamespaceSet(resolveModule(base.empty() ? alias.name : base + "." + alias.name));
            }
            bind(node, alias.asname.empty() ? alias.name : alias.asname, values);
        }
    }

} // namespace pyinfer::analysis
