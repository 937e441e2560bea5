#include "interpreter.h"
#include "runtime/scriptError.hpp"

#include <cmath>

namespace snap {

// Deep recursion in scripts would otherwise overflow the host stack
static constexpr int maxCallDepth = 256;
static thread_local int callDepth = 0;

namespace {

struct DepthGuard {
	explicit DepthGuard(const SourceLocation &location) {
		if (++callDepth > maxCallDepth) {
			--callDepth;
			throw ScriptError("Call stack too deep", location);
		}
	}
	~DepthGuard() { --callDepth; }
};

// Attach a location to errors raised by natives that have none
[[noreturn]] void rethrowAt(const ScriptError &error, const SourceLocation &location) {
	if (!error.location().isKnown()) {
		throw ScriptError(error.message(), location);
	}
	throw error;
}

} // namespace

// ============================================================================
// ScriptInstance
// ============================================================================

ScriptInstance::ScriptInstance(std::shared_ptr<const ClassInfo> info) : info(std::move(info)) {}

std::vector<MemberInfo> ScriptInstance::members() const {
	std::vector<MemberInfo> result;
	for (const VarDecl *field : info->fields) {
		result.push_back({field->name, false, field->is_private});
	}
	for (const PropertyDecl *property : info->properties) {
		result.push_back({property->name, true, property->is_private});
	}
	return result;
}

Value ScriptInstance::getMember(const std::string &name, bool isProperty) const {
	if (!isProperty) {
		std::lock_guard<std::mutex> lock(mutex);
		for (const auto &[fieldName, value] : fields) {
			if (fieldName == name) {
				return value;
			}
		}
	} else {
		for (const PropertyDecl *property : info->properties) {
			if (property->name == name) {
				auto instance = std::const_pointer_cast<Object>(shared_from_this());
				Interpreter interpreter(*info->module);
				return interpreter.evaluate(*property->getter, nullptr, Value(instance));
			}
		}
	}
	return Object::getMember(name, isProperty);
}

void ScriptInstance::setMember(const std::string &name, const Value &value) {
	std::lock_guard<std::mutex> lock(mutex);
	for (auto &[fieldName, fieldValue] : fields) {
		if (fieldName == name) {
			fieldValue = value;
			return;
		}
	}
	throw ScriptError("'" + info->name + "' has no field named '" + name + "'");
}

bool ScriptInstance::hasField(const std::string &name) const {
	std::lock_guard<std::mutex> lock(mutex);
	for (const auto &entry : fields) {
		if (entry.first == name) return true;
	}
	return false;
}

void ScriptInstance::initField(const std::string &name, Value value) {
	std::lock_guard<std::mutex> lock(mutex);
	fields.emplace_back(name, std::move(value));
}

// ============================================================================
// ScriptFunction / EnumTypeObject
// ============================================================================

Value ScriptFunction::call(const std::vector<Value> &args) const {
	Interpreter interpreter(*module);
	return interpreter.invoke(*this, args);
}

std::vector<MemberInfo> EnumTypeObject::members() const {
	std::vector<MemberInfo> result;
	for (const auto &value : decl->values) {
		result.push_back({value, false, false});
	}
	return result;
}

Value EnumTypeObject::getMember(const std::string &name, bool isProperty) const {
	if (!isProperty) {
		for (size_t i = 0; i < decl->values.size(); i++) {
			if (decl->values[i] == name) {
				return EnumValue{decl->name, name, static_cast<int64_t>(i)};
			}
		}
	}
	return Object::getMember(name, isProperty);
}

// ============================================================================
// Interpreter
// ============================================================================

Interpreter::Interpreter(Module &module) : module(module), scope(module.globals) {}

Value Interpreter::awaitTask(Module &module, const Task<Value> &task) {
	auto context = module.executionContext();
	if (context && context->isUiThread() && !task.isReady()) {
		// Wake the queue when the task completes
		task.then([context](const Task<Value> &) { context->post([] {}); });
		context->runUntil([&task] { return task.isReady(); });
	}
	return task.get();
}

Value Interpreter::invoke(const ScriptFunction &function, const std::vector<Value> &args) {
	const Callable &callable = *function.callable;
	const auto *decl = dynamic_cast<const Node *>(&callable);
	SourceLocation location = decl ? decl->location : SourceLocation{};
	DepthGuard guard(location);

	if (args.size() > callable.params.size()) {
		throw ScriptError("'" + function.functionName + "' expects " + std::to_string(callable.params.size()) +
		                      " arguments, got " + std::to_string(args.size()),
		                  location);
	}

	auto frame = std::make_shared<Environment>(function.closure);
	for (size_t i = 0; i < callable.params.size(); i++) {
		frame->define(callable.params[i].name, i < args.size() ? args[i] : Value());
	}

	auto run = [&]() -> Value {
		scope = frame;
		self = function.self;
		flow = Flow::Normal;
		result = Value();
		if (callable.body) {
			executeBlock(*callable.body, std::make_shared<Environment>(frame));
			Value returned = flow == Flow::Return ? result : Value();
			flow = Flow::Normal;
			return returned;
		}
		const auto *lambda = dynamic_cast<const FunctionExpr *>(&callable);
		if (lambda && lambda->expression_body) {
			return eval(*lambda->expression_body);
		}
		return Value();
	};

	if (!callable.is_async) {
		return run();
	}

	// Async bodies run eagerly; failures surface when the task is awaited
	try {
		return Value(std::make_shared<TaskObject>(Task<Value>::fromResult(run())));
	} catch (const ScriptError &) {
		return Value(std::make_shared<TaskObject>(Task<Value>::fromException(std::current_exception())));
	}
}

Value Interpreter::callGlobal(const std::string &name, const std::vector<Value> &args) {
	Value callee;
	if (!module.globals->lookup(name, callee)) {
		throw ScriptError("Undefined function '" + name + "'");
	}
	return callValue(callee, args, SourceLocation{});
}

Value Interpreter::evaluate(Expression &expression, std::shared_ptr<Environment> evalScope, Value thisValue) {
	scope = evalScope ? std::move(evalScope) : std::make_shared<Environment>(module.globals);
	self = std::move(thisValue);
	return eval(expression);
}

void Interpreter::defineGlobal(VarDecl &decl) {
	Value value = decl.initializer ? eval(*decl.initializer) : Value();
	module.globals->define(decl.name, std::move(value));
}

Value Interpreter::construct(const std::shared_ptr<const ClassInfo> &info, const std::vector<Value> &args,
                             const SourceLocation &location) {
	auto instance = std::make_shared<ScriptInstance>(info);
	Value instanceValue(instance);

	for (const VarDecl *field : info->fields) {
		Value initial;
		if (field->initializer) {
			Interpreter fieldInterpreter(module);
			initial = fieldInterpreter.evaluate(*field->initializer, nullptr, instanceValue);
		}
		instance->initField(field->name, std::move(initial));
	}

	auto init = info->methods.find("init");
	if (init != info->methods.end()) {
		ScriptFunction constructor(&module, init->second, info->name + ".init", module.globals, instanceValue);
		Interpreter initInterpreter(module);
		initInterpreter.invoke(constructor, args);
	} else if (!args.empty()) {
		throw ScriptError("'" + info->name + "' has no init method taking arguments", location);
	}
	return instanceValue;
}

Value Interpreter::eval(Expression &expression) {
	expression.accept(*this);
	return result;
}

void Interpreter::execute(Statement &statement) {
	statement.accept(*this);
}

void Interpreter::executeBlock(BlockStmt &block, std::shared_ptr<Environment> blockScope) {
	auto saved = scope;
	scope = std::move(blockScope);

	// Block scoping: every local of the block exists from its start
	for (auto &statement : block.statements) {
		if (auto *decl = dynamic_cast<VarDecl *>(statement.get())) {
			scope->define(decl->name, Value());
		}
	}

	try {
		for (auto &statement : block.statements) {
			execute(*statement);
			if (flow != Flow::Normal) {
				break;
			}
		}
	} catch (...) {
		scope = saved;
		throw;
	}
	scope = saved;
}

Value Interpreter::callValue(const Value &callee, const std::vector<Value> &args, const SourceLocation &location) {
	auto function = callee.objectAs<FunctionObject>();
	if (!function) {
		throw ScriptError("Value of type '" + callee.typeName() + "' is not callable", location);
	}
	try {
		return function->call(args);
	} catch (const ScriptError &error) {
		rethrowAt(error, location);
	}
}

Value Interpreter::memberOf(const Value &object, const std::string &member, const SourceLocation &location) {
	if (object.isNull()) {
		throw ScriptError("Null reference while reading '" + member + "'", location);
	}
	if (object.isString() && member == "Length") {
		return static_cast<int64_t>(object.asString().size());
	}
	if (!object.isObject()) {
		throw ScriptError("Value of type '" + object.typeName() + "' has no member '" + member + "'", location);
	}

	const ObjectRef &ref = object.asObject();

	if (auto instance = std::dynamic_pointer_cast<ScriptInstance>(ref)) {
		const ClassInfo &info = instance->classInfo();
		auto method = info.methods.find(member);
		if (method != info.methods.end()) {
			return Value(std::make_shared<ScriptFunction>(&module, method->second, info.name + "." + member,
			                                              module.globals, object));
		}
	}

	if (auto list = std::dynamic_pointer_cast<ListObject>(ref)) {
		if (member == "add") {
			return Value(std::make_shared<NativeFunctionObject>("add", [list](const std::vector<Value> &args) {
				for (const Value &arg : args) {
					list->add(arg);
				}
				return Value();
			}));
		}
	}

	try {
		for (const MemberInfo &info : ref->members()) {
			if (info.name == member) {
				return ref->getMember(member, info.isProperty);
			}
		}
	} catch (const ScriptError &error) {
		rethrowAt(error, location);
	}
	throw ScriptError("'" + ref->typeName() + "' has no member '" + member + "'", location);
}

Value Interpreter::binary(TokenType op, const Value &left, const Value &right, const SourceLocation &location) {
	switch (op) {
	case TokenType::EQUALS:
		return left.equals(right);
	case TokenType::NOT_EQUALS:
		return !left.equals(right);
	default:
		break;
	}

	if (op == TokenType::PLUS && (left.isString() || right.isString())) {
		return left.toString() + right.toString();
	}
	if (op == TokenType::PLUS && left.isChar() && right.isChar()) {
		return left.toString() + right.toString();
	}

	bool comparison = op == TokenType::LESS || op == TokenType::LESS_EQUAL || op == TokenType::GREATER ||
	                  op == TokenType::GREATER_EQUAL;

	if (comparison && ((left.isString() && right.isString()) || (left.isChar() && right.isChar()))) {
		int order = left.toString().compare(right.toString());
		switch (op) {
		case TokenType::LESS:
			return order < 0;
		case TokenType::LESS_EQUAL:
			return order <= 0;
		case TokenType::GREATER:
			return order > 0;
		default:
			return order >= 0;
		}
	}

	if (!left.isNumber() || !right.isNumber()) {
		throw ScriptError("Operator " + std::string(tokenTypeToString(op)) + " cannot be applied to '" +
		                      left.typeName() + "' and '" + right.typeName() + "'",
		                  location);
	}

	if (comparison) {
		double a = left.asDouble();
		double b = right.asDouble();
		if (left.isInt() && right.isInt()) {
			int64_t x = left.asInt();
			int64_t y = right.asInt();
			switch (op) {
			case TokenType::LESS:
				return x < y;
			case TokenType::LESS_EQUAL:
				return x <= y;
			case TokenType::GREATER:
				return x > y;
			default:
				return x >= y;
			}
		}
		switch (op) {
		case TokenType::LESS:
			return a < b;
		case TokenType::LESS_EQUAL:
			return a <= b;
		case TokenType::GREATER:
			return a > b;
		default:
			return a >= b;
		}
	}

	if (left.isInt() && right.isInt()) {
		int64_t x = left.asInt();
		int64_t y = right.asInt();
		switch (op) {
		case TokenType::PLUS:
			return x + y;
		case TokenType::MINUS:
			return x - y;
		case TokenType::STAR:
			return x * y;
		case TokenType::SLASH:
		case TokenType::PERCENT:
			if (y == 0) {
				throw ScriptError("Division by zero", location);
			}
			return op == TokenType::SLASH ? x / y : x % y;
		default:
			break;
		}
	} else {
		double x = left.asDouble();
		double y = right.asDouble();
		switch (op) {
		case TokenType::PLUS:
			return x + y;
		case TokenType::MINUS:
			return x - y;
		case TokenType::STAR:
			return x * y;
		case TokenType::SLASH:
			return x / y;
		case TokenType::PERCENT:
			return std::fmod(x, y);
		default:
			break;
		}
	}
	throw ScriptError("Unsupported operator " + std::string(tokenTypeToString(op)), location);
}

void Interpreter::assignTo(Expression &target, const Value &value) {
	if (auto *ident = dynamic_cast<Identifier *>(&target)) {
		if (!scope->assign(ident->name, value)) {
			throw ScriptError("Undefined variable '" + ident->name + "'", ident->location);
		}
	} else if (auto *member = dynamic_cast<MemberExpr *>(&target)) {
		Value object = eval(*member->object);
		if (!object.isObject()) {
			throw ScriptError("Cannot assign '" + member->member + "' on a value of type '" + object.typeName() + "'",
			                  member->location);
		}
		try {
			object.asObject()->setMember(member->member, value);
		} catch (const ScriptError &error) {
			rethrowAt(error, member->location);
		}
	} else if (auto *index = dynamic_cast<IndexExpr *>(&target)) {
		Value object = eval(*index->object);
		Value position = eval(*index->index);
		auto list = object.objectAs<ListObject>();
		if (!list) {
			throw ScriptError("Cannot index into a value of type '" + object.typeName() + "'", index->location);
		}
		try {
			list->set(position.asInt(), value);
		} catch (const ScriptError &error) {
			rethrowAt(error, index->location);
		}
	}
}

// ----------------------------------------------------------------------------
// Expressions
// ----------------------------------------------------------------------------

void Interpreter::visit(IntegerLiteral &node) { result = node.value; }
void Interpreter::visit(FloatLiteral &node) { result = node.value; }
void Interpreter::visit(StringLiteral &node) { result = node.value; }
void Interpreter::visit(CharLiteral &node) { result = node.value; }
void Interpreter::visit(BoolLiteral &node) { result = node.value; }

void Interpreter::visit(NullLiteral &node) {
	(void)node;
	result = Value();
}

void Interpreter::visit(ThisExpr &node) {
	if (self.isNull()) {
		throw ScriptError("'this' is not available here", node.location);
	}
	result = self;
}

void Interpreter::visit(Identifier &node) {
	Value value;
	if (!scope->lookup(node.name, value)) {
		throw ScriptError("Undefined variable '" + node.name + "'", node.location);
	}
	result = value;
}

void Interpreter::visit(UnaryExpr &node) {
	Value operand = eval(*node.operand);
	if (node.op == TokenType::NOT) {
		result = !operand.truthy();
	} else if (operand.isInt()) {
		result = -operand.asInt();
	} else if (operand.isDouble()) {
		result = -operand.asDouble();
	} else {
		throw ScriptError("Cannot negate a value of type '" + operand.typeName() + "'", node.location);
	}
}

void Interpreter::visit(BinaryExpr &node) {
	if (node.op == TokenType::AND) {
		result = eval(*node.left).truthy() && eval(*node.right).truthy();
		return;
	}
	if (node.op == TokenType::OR) {
		result = eval(*node.left).truthy() || eval(*node.right).truthy();
		return;
	}
	Value left = eval(*node.left);
	Value right = eval(*node.right);
	result = binary(node.op, left, right, node.location);
}

void Interpreter::visit(AssignExpr &node) {
	Value value = eval(*node.value);
	if (node.op != TokenType::ASSIGN) {
		Value current = eval(*node.target);
		value = binary(node.op == TokenType::PLUS_ASSIGN ? TokenType::PLUS : TokenType::MINUS, current, value,
		               node.location);
	}
	assignTo(*node.target, value);
	result = value;
}

void Interpreter::visit(CallExpr &node) {
	Value callee = eval(*node.callee);
	std::vector<Value> args;
	args.reserve(node.arguments.size());
	for (auto &arg : node.arguments) {
		args.push_back(eval(*arg));
	}
	// Restored: the callee may run in this interpreter's frame state
	auto savedScope = scope;
	Value savedSelf = self;
	Value value = callValue(callee, args, node.location);
	scope = savedScope;
	self = savedSelf;
	result = value;
}

void Interpreter::visit(MemberExpr &node) {
	Value object = eval(*node.object);
	result = memberOf(object, node.member, node.location);
}

void Interpreter::visit(IndexExpr &node) {
	Value object = eval(*node.object);
	Value index = eval(*node.index);
	if (object.isString()) {
		const std::string &text = object.asString();
		int64_t position = index.asInt();
		if (position < 0 || static_cast<size_t>(position) >= text.size()) {
			throw ScriptError("Index " + std::to_string(position) + " is out of range", node.location);
		}
		result = text[static_cast<size_t>(position)];
		return;
	}
	auto list = object.objectAs<ListObject>();
	if (!list) {
		throw ScriptError("Cannot index into a value of type '" + object.typeName() + "'", node.location);
	}
	try {
		result = list->at(index.asInt());
	} catch (const ScriptError &error) {
		rethrowAt(error, node.location);
	}
}

void Interpreter::visit(ListExpr &node) {
	std::vector<Value> elements;
	for (auto &element : node.elements) {
		elements.push_back(eval(*element));
	}
	result = Value(std::make_shared<ListObject>(std::move(elements)));
}

void Interpreter::visit(NewExpr &node) {
	auto it = module.classes.find(node.class_name);
	if (it == module.classes.end()) {
		throw ScriptError("Unknown class '" + node.class_name + "'", node.location);
	}
	std::vector<Value> args;
	for (auto &arg : node.arguments) {
		args.push_back(eval(*arg));
	}
	auto savedScope = scope;
	Value savedSelf = self;
	Value instance = construct(it->second, args, node.location);
	scope = savedScope;
	self = savedSelf;
	result = instance;
}

void Interpreter::visit(AwaitExpr &node) {
	Value operand = eval(*node.operand);
	auto task = operand.objectAs<TaskObject>();
	if (!task) {
		result = operand;
		return;
	}
	try {
		result = awaitTask(module, task->task());
	} catch (const ScriptError &error) {
		rethrowAt(error, node.location);
	}
}

void Interpreter::visit(FunctionExpr &node) {
	std::string name = node.is_lambda ? "<lambda>" : "<anonymous>";
	result = Value(std::make_shared<ScriptFunction>(&module, &node, name, scope, self));
}

// ----------------------------------------------------------------------------
// Statements
// ----------------------------------------------------------------------------

void Interpreter::visit(VarDecl &node) {
	Value value = node.initializer ? eval(*node.initializer) : Value();
	scope->define(node.name, std::move(value));
}

void Interpreter::visit(BlockStmt &node) {
	executeBlock(node, std::make_shared<Environment>(scope));
}

void Interpreter::visit(IfStmt &node) {
	if (eval(*node.condition).truthy()) {
		execute(*node.then_branch);
	} else if (node.else_branch) {
		execute(*node.else_branch);
	}
}

void Interpreter::visit(WhileStmt &node) {
	while (eval(*node.condition).truthy()) {
		execute(*node.body);
		if (flow == Flow::Break) {
			flow = Flow::Normal;
			break;
		}
		if (flow == Flow::Continue) {
			flow = Flow::Normal;
		}
		if (flow == Flow::Return) {
			break;
		}
	}
}

void Interpreter::visit(ForStmt &node) {
	Value iterable = eval(*node.iterable);
	std::vector<Value> items;
	if (iterable.isString()) {
		for (char c : iterable.asString()) {
			items.emplace_back(c);
		}
	} else if (iterable.isObject() && iterable.asObject()->isEnumerable()) {
		items = iterable.asObject()->items();
	} else {
		throw ScriptError("Cannot iterate over a value of type '" + iterable.typeName() + "'", node.location);
	}

	auto saved = scope;
	for (const Value &item : items) {
		scope = std::make_shared<Environment>(saved);
		scope->define(node.var_name, item);
		try {
			execute(*node.body);
		} catch (...) {
			scope = saved;
			throw;
		}
		if (flow == Flow::Break) {
			flow = Flow::Normal;
			break;
		}
		if (flow == Flow::Continue) {
			flow = Flow::Normal;
		}
		if (flow == Flow::Return) {
			break;
		}
	}
	scope = saved;
}

void Interpreter::visit(ReturnStmt &node) {
	result = node.value ? eval(*node.value) : Value();
	flow = Flow::Return;
}

void Interpreter::visit(BreakStmt &node) {
	(void)node;
	flow = Flow::Break;
}

void Interpreter::visit(ContinueStmt &node) {
	(void)node;
	flow = Flow::Continue;
}

void Interpreter::visit(ExpressionStmt &node) {
	eval(*node.expression);
}

// Declarations are registered by the module, never executed
void Interpreter::visit(FunctionDecl &node) { (void)node; }
void Interpreter::visit(PropertyDecl &node) { (void)node; }
void Interpreter::visit(ClassDecl &node) { (void)node; }
void Interpreter::visit(EnumDecl &node) { (void)node; }
void Interpreter::visit(Program &node) { (void)node; }

} // namespace snap
