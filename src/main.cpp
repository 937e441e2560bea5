#include "compiler/document.hpp"
#include "console/consolePresenter.hpp"
#include "debugger/breakpointController.hpp"
#include "debugger/dispatcher.hpp"
#include "debugger/localDebugger.hpp"
#include "instrumentation/instrumentor.hpp"
#include "ipc/debuggerServer.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "runtime/scriptObjects.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " run <file.snap> [options]\n";
    std::cerr << "       " << program << " toggle <file.snap> <line>\n";
    std::cerr << "       " << program << " instrument <file.snap>\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --pre <file>         Source compiled in front of the file\n";
    std::cerr << "  --post <file>        Source compiled after the file\n";
    std::cerr << "  --ref <file>         Reference script (repeatable)\n";
    std::cerr << "  --client <exe>       Show breakpoints in a separate debugger process\n";
    std::cerr << "  --client-arg <arg>   Extra argument for the debugger process (repeatable)\n";
    std::cerr << "  --script <commands>  Breakpoint commands separated by ';' instead of stdin\n";
    std::cerr << "  --debug              Enable debug logging\n";
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const std::string& path, const std::string& contents) {
    std::ofstream file(path);
    if (!file || !(file << contents)) {
        throw std::runtime_error("Cannot write file: " + path);
    }
}

struct RunOptions {
    std::string sourceFile;
    std::string preFile;
    std::string postFile;
    std::vector<std::string> references;
    std::string clientExe;
    std::vector<std::string> clientArgs;
    std::string script;
    bool debug = false;
};

int runScript(const RunOptions& options) {
    snap::Document document(readFile(options.sourceFile),
                            options.preFile.empty() ? "" : readFile(options.preFile),
                            options.postFile.empty() ? "" : readFile(options.postFile),
                            options.references);

    auto dispatcher = std::make_shared<snap::Dispatcher>();
    snap::BreakpointController controller(dispatcher);
    controller.setDebug(options.debug);

    auto source = std::make_shared<snap::SourceView>(document.preSource(), document.postSource());
    source->setText(document.text());
    source->setReferences(document.references());

    auto presenter = std::make_shared<snap::ConsolePresenter>(std::cin, std::cout);
    presenter->setSource(source);
    if (!options.script.empty()) {
        presenter->setScript(snap::ConsolePresenter::splitScript(options.script));
    }

    std::unique_ptr<snap::DebuggerServer> server;
    snap::SyncBreakpointHook synchronousHook;
    snap::AsyncBreakpointHook asynchronousHook;
    if (options.clientExe.empty()) {
        snap::LocalDebugger debugger(dispatcher, presenter);
        synchronousHook = controller.synchronousHandler(debugger.synchronousCallback());
        asynchronousHook = controller.asynchronousHandler(debugger.asynchronousCallback());
    } else {
        snap::DebuggerOptions debuggerOptions;
        debuggerOptions.debug = options.debug;
        server = std::make_unique<snap::DebuggerServer>(options.clientExe, options.clientArgs,
                                                        snap::DebuggerServer::ClientPidResolver(),
                                                        debuggerOptions);
        synchronousHook = controller.synchronousHandler(server->synchronousBreak(document));
        asynchronousHook = controller.asynchronousHandler(server->asynchronousBreak(document));
    }

    snap::CompileOptions compileOptions;
    compileOptions.filename = options.sourceFile;
    compileOptions.debug = options.debug;
    snap::CompileResult result = document.compile(synchronousHook, asynchronousHook, compileOptions);
    for (const auto& diagnostic : result.diagnostics) {
        std::cerr << diagnostic.toString() << "\n";
    }
    if (!result.succeeded()) {
        return 1;
    }
    if (!result.module->hasFunction("main")) {
        std::cerr << "Error: No main function\n";
        return 1;
    }

    // The script runs on a worker; this thread stays the dispatcher's
    result.module->setExecutionContext(dispatcher);
    std::atomic<bool> done{false};
    std::exception_ptr failure;
    std::thread worker([&]() {
        try {
            snap::Value value = result.module->call("main");
            if (auto task = value.objectAs<snap::TaskObject>()) {
                task->task().get();
            }
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        done = true;
        dispatcher->post([]() {});
    });
    dispatcher->runUntil([&]() { return done.load(); });
    worker.join();

    if (server) {
        server->dispose();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    return 0;
}

int toggleLine(const std::string& path, const std::string& lineText) {
    size_t line = std::stoul(lineText);
    if (line == 0) {
        std::cerr << "Error: Lines are numbered from 1\n";
        return 1;
    }
    snap::Document document(readFile(path));
    switch (document.toggleBreakpoint(line - 1)) {
    case snap::BreakpointToggleResult::Added:
        writeFile(path, document.text());
        std::cout << "Breakpoint added at line " << line << "\n";
        return 0;
    case snap::BreakpointToggleResult::Removed:
        writeFile(path, document.text());
        std::cout << "Breakpoint removed at line " << line << "\n";
        return 0;
    case snap::BreakpointToggleResult::InvalidPosition:
        std::cerr << "Error: No statement at line " << line << "\n";
        return 1;
    }
    return 1;
}

int instrumentFile(const std::string& path) {
    std::string source = readFile(path);
    snap::Lexer lexer(source, path);
    snap::Parser parser(lexer);
    auto program = parser.parse();
    if (parser.has_errors()) {
        for (const auto& diagnostic : parser.diagnostics()) {
            std::cerr << diagnostic.toString() << "\n";
        }
        return 1;
    }

    snap::Instrumentor instrumentor(snap::uniqueIdentifierSuffix(), true, true);
    std::cout << instrumentor.instrument(*program, source);
    std::cout << "\n// debugger shim\n" << instrumentor.shimSource();
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        std::string command = argv[1];
        RunOptions options;
        std::vector<std::string> positional;

        for (int argIndex = 2; argIndex < argc; argIndex++) {
            std::string arg = argv[argIndex];
            auto value = [&]() -> std::string {
                if (argIndex + 1 >= argc) {
                    throw std::runtime_error("Missing value for " + arg);
                }
                return argv[++argIndex];
            };
            if (arg == "--pre") {
                options.preFile = value();
            } else if (arg == "--post") {
                options.postFile = value();
            } else if (arg == "--ref") {
                options.references.push_back(value());
            } else if (arg == "--client") {
                options.clientExe = value();
            } else if (arg == "--client-arg") {
                options.clientArgs.push_back(value());
            } else if (arg == "--script") {
                options.script = value();
            } else if (arg == "--debug") {
                options.debug = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }

        if (command == "run" && positional.size() == 1) {
            options.sourceFile = positional[0];
            return runScript(options);
        }
        if (command == "toggle" && positional.size() == 2) {
            return toggleLine(positional[0], positional[1]);
        }
        if (command == "instrument" && positional.size() == 1) {
            return instrumentFile(positional[0]);
        }
        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
