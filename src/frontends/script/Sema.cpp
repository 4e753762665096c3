//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.cpp
/// @brief Entry point, declarations and call-graph summary for Sema.
///
/// @details Statement analysis lives in Sema_Stmt.cpp and expression typing
/// in Sema_Expr.cpp.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/Sema.hpp"
#include "frontends/script/DiagnosticCodes.hpp"

#include <algorithm>
#include <set>

namespace rosella::frontends::script
{

const std::vector<std::string_view> &Sema::reservedStorageNames()
{
    // Variables owned by sh or cmd.exe; assigning them would change the
    // behaviour of the interpreter itself. Compared case-insensitively.
    static const std::vector<std::string_view> names = {
        "APPDATA",  "CD",      "CDPATH",      "CMDCMDLINE", "CMDEXTVERSION", "COMSPEC",
        "DATE",     "ENV",     "ERRORLEVEL",  "HOME",       "HOSTNAME",      "IFS",
        "LANG",     "LC_ALL",  "LINENO",      "MAIL",       "MAILPATH",      "OLDPWD",
        "OPTARG",   "OPTIND",  "PATH",        "PATHEXT",    "PPID",          "PROMPT",
        "PS1",      "PS2",     "PS4",         "PWD",        "RANDOM",        "SECONDS",
        "SHELL",    "SYSTEMROOT", "TEMP",     "TERM",       "TIME",          "TMP",
        "TMPDIR",   "USER",    "USERNAME",    "USERPROFILE", "WINDIR",
    };
    return names;
}

Sema::Sema(const Program &program) : program_(program) {}

bool Sema::analyze()
{
    do
    {
        resetState();
        registerFunctions();
        if (hasError())
            return false;

        scopes_.pushScope(); // global frame
        for (StmtId id : program_.topLevel)
        {
            analyzeStmt(id);
            if (hasError())
                break;
        }
        scopes_.popScope();

        if (hasError())
            return false;
    } while (promoteIntParams());

    computeEscapingWrites();
    return true;
}

/// @brief Clear everything one walk produces; promoted parameter types stay.
void Sema::resetState()
{
    result_ = SemaResult{};
    result_.exprs.resize(program_.exprs.size());
    result_.stmts.resize(program_.stmts.size());

    storageNames_ = common::NameMangler{};
    for (std::string_view name : reservedStorageNames())
        storageNames_.reserve(std::string(name));
    labels_ = common::NameMangler{};

    scopes_.reset();
    functionIndex_.clear();
    directWrites_.clear();
    promotable_.clear();
    called_.clear();
    storageDepth_.clear();
    loopBodies_.clear();
    currentFunction_ = kInvalidId;
}

/// @brief Promote untyped parameters that only ever receive Int arguments.
/// @return True when at least one parameter changed type.
bool Sema::promoteIntParams()
{
    bool promoted = false;
    for (size_t fn = 0; fn < paramTypes_.size(); ++fn)
    {
        if (!called_[fn])
            continue;
        for (size_t i = 0; i < paramTypes_[fn].size(); ++i)
        {
            if (paramTypes_[fn][i] == TypeTag::Untyped && promotable_[fn][i])
            {
                paramTypes_[fn][i] = TypeTag::Int;
                promoted = true;
            }
        }
    }
    return promoted;
}

/// @brief Register every top-level function so calls may precede declarations.
void Sema::registerFunctions()
{
    for (StmtId id : program_.topLevel)
    {
        const Stmt &stmt = program_.stmt(id);
        if (stmt.kind() != StmtKind::FunctionDecl)
            continue;

        const auto &decl = stmt.as<FunctionDecl>();
        if (functionIndex_.contains(decl.name))
        {
            error(ErrorKind::Name,
                  stmt.loc,
                  "function '" + decl.name + "' is already declared",
                  diag::DuplicateFunction,
                  decl.name);
            return;
        }

        FunctionSymbol fn;
        fn.name = decl.name;
        fn.label = labels_.unique("fn_" + decl.name);
        fn.decl = id;

        const auto fnId = static_cast<FunctionId>(result_.functions.size());
        functionIndex_.emplace(decl.name, fnId);
        result_.functions.push_back(std::move(fn));
        result_.stmts[id].function = fnId;

        if (paramTypes_.size() == fnId)
        {
            std::vector<TypeTag> types;
            for (const auto &param : decl.params)
                types.push_back(param.type);
            paramTypes_.push_back(std::move(types));
        }
        promotable_.emplace_back(decl.params.size(), true);
    }
    directWrites_.resize(result_.functions.size());
    called_.assign(result_.functions.size(), false);
}

bool Sema::checkReservedName(const std::string &name, SourceLoc loc)
{
    if (name.starts_with("__"))
    {
        error(ErrorKind::Name,
              loc,
              "identifier '" + name + "' is reserved; names starting with '__' belong to "
                                      "generated code",
              diag::ReservedIdentifier,
              name);
        return false;
    }
    return true;
}

SymbolId Sema::declareVar(const std::string &name, TypeTag type, SourceLoc loc, unsigned paramIndex)
{
    VarSymbol sym;
    sym.name = name;
    sym.storage = storageNames_.unique(name);
    sym.type = type;
    sym.loc = loc;
    sym.owner = currentFunction_;
    sym.isParam = paramIndex != 0;
    sym.paramIndex = paramIndex;

    const auto id = static_cast<SymbolId>(result_.vars.size());
    result_.vars.push_back(std::move(sym));
    storageDepth_.push_back(scopes_.depth());
    scopes_.bind(name, id);
    return id;
}

/// @brief Bind a loop-body redeclaration to the storage of @p outer.
///
/// The new binding may carry a different type; reads through either name
/// see the same variable in the generated script. Like an assignment, it
/// keeps a parameter from being promoted, and a global written from a
/// function body counts as a direct write of that function.
SymbolId Sema::rebindVar(SymbolId outer, TypeTag type, SourceLoc loc)
{
    const SymbolId root =
        result_.vars[outer].rebinds != kInvalidId ? result_.vars[outer].rebinds : outer;

    VarSymbol sym;
    sym.name = result_.vars[root].name;
    sym.storage = result_.vars[root].storage;
    sym.type = type;
    sym.loc = loc;
    sym.owner = result_.vars[root].owner;
    sym.rebinds = root;

    if (result_.vars[root].isParam)
        promotable_[sym.owner][result_.vars[root].paramIndex - 1] = false;
    if (currentFunction_ != kInvalidId && sym.isGlobal())
        directWrites_[currentFunction_].push_back(root);

    const auto id = static_cast<SymbolId>(result_.vars.size());
    const std::string name = sym.name;
    result_.vars.push_back(std::move(sym));
    storageDepth_.push_back(storageDepth_[root]);
    scopes_.bind(name, id);
    return id;
}

/// @brief Propagate direct global writes along the call graph to a fixpoint.
///
/// A function's escaping writes are its own global assignments plus the
/// escaping writes of every function it calls. Recursion is handled by
/// iterating until no set grows. Ordered sets keep the output stable.
void Sema::computeEscapingWrites()
{
    const size_t count = result_.functions.size();
    std::vector<std::set<SymbolId>> writes(count);
    for (size_t i = 0; i < count; ++i)
        writes[i].insert(directWrites_[i].begin(), directWrites_[i].end());

    bool changed = true;
    while (changed)
    {
        changed = false;
        for (size_t i = 0; i < count; ++i)
        {
            for (FunctionId callee : result_.functions[i].callees)
            {
                for (SymbolId sym : writes[callee])
                {
                    if (writes[i].insert(sym).second)
                        changed = true;
                }
            }
        }
    }

    for (size_t i = 0; i < count; ++i)
        result_.functions[i].escapingWrites.assign(writes[i].begin(), writes[i].end());
}

void Sema::error(
    ErrorKind kind, SourceLoc loc, std::string message, std::string_view code, std::string subject)
{
    if (error_)
        return;
    CompileError err;
    err.kind = kind;
    err.loc = loc;
    err.message = std::move(message);
    err.subject = std::move(subject);
    err.code = code;
    error_ = std::move(err);
}

} // namespace rosella::frontends::script
