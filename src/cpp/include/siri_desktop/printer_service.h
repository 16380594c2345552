#pragma once

#include <memory>
#include <string>
#include <vector>

namespace siri_desktop {

struct CommandResult {
    int exit_code = -1;
    std::string output;     // stdout and stderr, one line per '\n'
};

// Runs an external command to completion
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Throws siri::ProcessException when the command cannot be started
    virtual CommandResult run(const std::string& executable,
                              const std::vector<std::string>& args) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    explicit SystemCommandRunner(int timeout_seconds = 60) : timeout_seconds_(timeout_seconds) {}

    CommandResult run(const std::string& executable,
                      const std::vector<std::string>& args) override;

private:
    int timeout_seconds_;
};

// Printer names from command output: lines trimmed, blanks and the
// "Name" column header dropped
std::vector<std::string> parse_printer_list(const std::string& output);

// Quote a value for a single-quoted PowerShell string literal
std::string quote_powershell(const std::string& value);

class PrinterService {
public:
    explicit PrinterService(std::shared_ptr<CommandRunner> runner,
                            bool printing_supported = is_platform_supported());

    // Installed printers. Queries the system management interface first and
    // falls back to the legacy tool when that yields nothing.
    // Throws PrinterException when both fail.
    std::vector<std::string> list_printers();

    // Print plain text, to the default printer when printer_name is empty.
    // Throws PrinterException when printing fails.
    void print_text(const std::string& content, const std::string& printer_name = "");

    static bool is_platform_supported();

private:
    void require_supported(const char* operation) const;

    std::shared_ptr<CommandRunner> runner_;
    bool printing_supported_;
};

} // namespace siri_desktop
