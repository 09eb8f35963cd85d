#include <gtest/gtest.h>

#include "remote/remote_command.hpp"

using speakerctrl::remote::RemoteCommand;
namespace cmd = speakerctrl::remote::cmd;

TEST(ShellQuoteTest, SafeWordsStayBare) {
  EXPECT_EQ(speakerctrl::remote::shell_quote("/etc/hosts"), "/etc/hosts");
  EXPECT_EQ(speakerctrl::remote::shell_quote("remount,rw"), "remount,rw");
  EXPECT_EQ(speakerctrl::remote::shell_quote("["), "[");
}

TEST(ShellQuoteTest, UnsafeWordsAreSingleQuoted) {
  EXPECT_EQ(speakerctrl::remote::shell_quote("# AfterTouch"), "'# AfterTouch'");
  EXPECT_EQ(speakerctrl::remote::shell_quote(""), "''");
  EXPECT_EQ(speakerctrl::remote::shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(speakerctrl::remote::shell_quote("a;rm -rf /"), "'a;rm -rf /'");
}

TEST(RemoteCommandTest, RemountRwFallsBackToMount) {
  EXPECT_EQ(cmd::remount_rw().to_shell_string(),
            "(rw || mount -o remount,rw /)");
  EXPECT_EQ(cmd::privileged(cmd::touch("/tmp/remote_services"))
                .to_shell_string(),
            "(rw || mount -o remount,rw /) && touch /tmp/remote_services");
}

TEST(RemoteCommandTest, FileTestAndGrep) {
  EXPECT_EQ(cmd::file_exists("/etc/hosts.original").to_shell_string(),
            "[ -f /etc/hosts.original ]");
  EXPECT_EQ(cmd::grep_fixed("# AfterTouch", "/etc/pki/tls/certs/ca-bundle.crt")
                .to_shell_string(),
            "grep -F '# AfterTouch' /etc/pki/tls/certs/ca-bundle.crt");
}

TEST(RemoteCommandTest, PipelineKeepsStructure) {
  auto pipeline = RemoteCommand::exec({"echo", "-ne", "\\x00\\x1d"})
                      .pipe_to(RemoteCommand::exec({"nc", "-w", "5",
                                                    "192.168.1.10", "53"}))
                      .pipe_to(RemoteCommand::exec({"tail", "-c", "4"}));
  EXPECT_EQ(pipeline.kind(), RemoteCommand::Kind::Pipe);
  EXPECT_EQ(pipeline.right().argv().front(), "tail");
  EXPECT_EQ(pipeline.to_shell_string(),
            "echo -ne '\\x00\\x1d' | nc -w 5 192.168.1.10 53 | tail -c 4");
}

TEST(RemoteCommandTest, EmptyArgvIsRejected) {
  EXPECT_THROW(RemoteCommand(std::vector<std::string>{}),
               std::invalid_argument);
}
