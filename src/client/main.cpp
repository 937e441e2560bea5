#include "console/consolePresenter.hpp"
#include "ipc/debuggerClient.hpp"

#include <fstream>
#include <iostream>

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <parent pid> <input pipe> <output pipe>\n";
    std::cerr << "\nStarted by snapdbg to show breakpoints of another process.\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --script <commands>  Breakpoint commands separated by ';' instead of stdin\n";
    std::cerr << "  --transcript <file>  Write the session to a file instead of stdout\n";
    std::cerr << "  --debug              Enable debug logging\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.size() < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string script;
    std::string transcriptFile;
    snap::DebuggerOptions options;
    bool scripted = false;

    // The last three arguments belong to the debugger protocol
    for (size_t argIndex = 0; argIndex + 3 < args.size(); argIndex++) {
        const std::string& arg = args[argIndex];
        if (arg == "--script" && argIndex + 4 < args.size()) {
            script = args[++argIndex];
            scripted = true;
        } else if (arg == "--transcript" && argIndex + 4 < args.size()) {
            transcriptFile = args[++argIndex];
        } else if (arg == "--debug") {
            options.debug = true;
        } else {
            std::cerr << "Warning: Ignoring argument " << arg << "\n";
        }
    }

    try {
        std::ofstream transcript;
        if (!transcriptFile.empty()) {
            transcript.open(transcriptFile);
            if (!transcript) {
                throw std::runtime_error("Cannot open transcript file: " + transcriptFile);
            }
        }
        std::ostream& out = transcriptFile.empty() ? std::cout : transcript;

        snap::DebuggerClient client(args, options);
        snap::ConsolePresenter presenter(std::cin, out);
        if (scripted) {
            presenter.setScript(snap::ConsolePresenter::splitScript(script));
        }

        client.onBreakpointHit([&](std::shared_ptr<const snap::RemoteBreakpointInfo> info,
                                   const snap::SourceView& source) {
            bool suppress = presenter.present(info->span().start, source, snap::variableTree(*info));
            client.resume(suppress);
        });
        client.onBreakpointResumed([&]() { out << "Resumed" << std::endl; });
        client.onParentProcessExited([&]() { out << "Debugged process exited" << std::endl; });

        client.start();
        client.wait();
        client.dispose();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
