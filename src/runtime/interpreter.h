#pragma once

#include "ast/ast.hpp"
#include "environment.h"
#include "runtime/module.hpp"
#include "runtime/object.hpp"
#include "runtime/scriptObjects.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace snap {

struct ClassInfo {
	std::string name;
	Module *module{};
	std::vector<const VarDecl *> fields;
	std::vector<const PropertyDecl *> properties;
	std::map<std::string, const FunctionDecl *> methods;
};

// Instance of a script class
class ScriptInstance : public Object {
public:
	explicit ScriptInstance(std::shared_ptr<const ClassInfo> info);

	std::string typeName() const override { return info->name; }
	std::vector<MemberInfo> members() const override;
	Value getMember(const std::string &name, bool isProperty) const override;
	void setMember(const std::string &name, const Value &value) override;

	const ClassInfo &classInfo() const { return *info; }
	bool hasField(const std::string &name) const;
	void initField(const std::string &name, Value value);

private:
	std::shared_ptr<const ClassInfo> info;
	mutable std::mutex mutex;
	std::vector<std::pair<std::string, Value>> fields;
};

// Named function, method, anonymous method or lambda bound to its scope
class ScriptFunction : public FunctionObject {
public:
	ScriptFunction(Module *module, const Callable *callable, std::string name,
	               std::shared_ptr<Environment> closure, Value self)
	    : module(module), callable(callable), functionName(std::move(name)), closure(std::move(closure)),
	      self(std::move(self)) {}

	std::string name() const override { return functionName; }
	Value call(const std::vector<Value> &args) const override;

	Module *module;
	const Callable *callable;
	std::string functionName;
	std::shared_ptr<Environment> closure;
	Value self;
};

// `Color` in `Color.Red`
class EnumTypeObject : public Object {
public:
	explicit EnumTypeObject(const EnumDecl *decl) : decl(decl) {}

	std::string typeName() const override { return decl->name; }
	ObjectKind kind() const override { return ObjectKind::Other; }
	std::vector<MemberInfo> members() const override;
	Value getMember(const std::string &name, bool isProperty) const override;

private:
	const EnumDecl *decl;
};

/**
 * Tree-walking evaluator. One instance per call on the calling thread; all
 * shared state lives in the Module.
 */
class Interpreter : public ASTVisitor {
public:
	explicit Interpreter(Module &module);

	Value invoke(const ScriptFunction &function, const std::vector<Value> &args);
	Value callGlobal(const std::string &name, const std::vector<Value> &args);
	Value evaluate(Expression &expression, std::shared_ptr<Environment> scope, Value thisValue);
	Value construct(const std::shared_ptr<const ClassInfo> &info, const std::vector<Value> &args,
	                const SourceLocation &location);
	void defineGlobal(VarDecl &decl);

	// Wait for a task; on the UI thread queued work keeps running meanwhile
	static Value awaitTask(Module &module, const Task<Value> &task);

	void visit(IntegerLiteral &node) override;
	void visit(FloatLiteral &node) override;
	void visit(StringLiteral &node) override;
	void visit(CharLiteral &node) override;
	void visit(BoolLiteral &node) override;
	void visit(NullLiteral &node) override;
	void visit(ThisExpr &node) override;
	void visit(Identifier &node) override;
	void visit(UnaryExpr &node) override;
	void visit(BinaryExpr &node) override;
	void visit(AssignExpr &node) override;
	void visit(CallExpr &node) override;
	void visit(MemberExpr &node) override;
	void visit(IndexExpr &node) override;
	void visit(ListExpr &node) override;
	void visit(NewExpr &node) override;
	void visit(AwaitExpr &node) override;
	void visit(FunctionExpr &node) override;
	void visit(VarDecl &node) override;
	void visit(BlockStmt &node) override;
	void visit(IfStmt &node) override;
	void visit(WhileStmt &node) override;
	void visit(ForStmt &node) override;
	void visit(ReturnStmt &node) override;
	void visit(BreakStmt &node) override;
	void visit(ContinueStmt &node) override;
	void visit(ExpressionStmt &node) override;
	void visit(FunctionDecl &node) override;
	void visit(PropertyDecl &node) override;
	void visit(ClassDecl &node) override;
	void visit(EnumDecl &node) override;
	void visit(Program &node) override;

private:
	enum class Flow { Normal, Break, Continue, Return };

	Module &module;
	std::shared_ptr<Environment> scope;
	Value self;
	Value result;
	Flow flow{Flow::Normal};

	Value eval(Expression &expression);
	void execute(Statement &statement);
	void executeBlock(BlockStmt &block, std::shared_ptr<Environment> blockScope);
	Value callValue(const Value &callee, const std::vector<Value> &args, const SourceLocation &location);
	Value memberOf(const Value &object, const std::string &member, const SourceLocation &location);
	Value binary(TokenType op, const Value &left, const Value &right, const SourceLocation &location);
	void assignTo(Expression &target, const Value &value);
};

} // namespace snap
