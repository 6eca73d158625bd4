/**
 * TestCase: Test_CommandQueue
 *
 * Goal:
 *   One command outstanding at a time, and nothing unsafe on the wire.
 *
 * Expected behavior:
 *   - processNext() writes nothing while a response is outstanding.
 *   - Every line ends in CRLF.
 *   - Text with characters outside [A-Za-z0-9 whitespace - . :] is skipped
 *     and counted as a rejected command.
 *   - submitPriority() drops queued polls and goes next, behind any user
 *     command already waiting.
 *   - A user command that finds the link down raises the reconnect hook.
 */

#include "FakeTransport.h"
#include "TestBench.h"
#include "TestCase.h"
#include "command_queue.h"
#include "poller.h"

class Test_CommandQueue : public BasicTestCase
{
public:
    const char *name() const override { return "CommandQueue: single outstanding, sanitizing"; }

protected:
    void run() override
    {
        check(CommandQueue::isSafeCommandText("power outlets 3 on"), "plain command rejected");
        check(CommandQueue::isSafeCommandText("show sensor inlet I1 activePower"), "sensor query rejected");
        check(CommandQueue::isSafeCommandText("y"), "reply rejected");
        check(!CommandQueue::isSafeCommandText(""), "empty command accepted");
        check(!CommandQueue::isSafeCommandText("show outlets; reboot"), "';' accepted");
        check(!CommandQueue::isSafeCommandText("show\x1b[2J"), "escape sequence accepted");

        TestBench bench;
        FakeTransport transport;
        transport.connected = true;
        PerformanceStats performance;
        ErrorStats errors;
        CommandQueue queue(transport, bench.scheduler, performance, errors);

        queue.enqueue(Poller::buildBatch(true));
        check(queue.size() == 6, "poll batch size");

        check(queue.processNext(), "first command not sent");
        check(transport.lastWrite() == "show inlets\r\n", "first write: " + transport.lastWrite());
        check(!queue.processNext(), "second command sent while awaiting a response");
        check(transport.writes.size() == 1, "more than one command outstanding");

        queue.completeResponse();
        check(queue.processNext(), "next command not sent after response");
        check(transport.lastWrite() == "show sensor externalsensor 1\r\n", "second write: " + transport.lastWrite());
        check(performance.commandsSent == 2, "commandsSent counter");

        // Unsafe text is skipped, the next command goes out instead
        queue.clear();
        queue.push(PduCommand::query("show outlets; reboot"));
        queue.push(PduCommand::query("show outlets"));
        check(queue.processNext(), "safe command after an unsafe one not sent");
        check(transport.lastWrite() == "show outlets\r\n", "unsafe command reached the wire");
        check(errors.commandErrors == 1 && errors.lastErrorType == ErrorType::COMMAND_REJECTED,
              "unsafe command not recorded as rejected");

        // Priority command waits for the outstanding response, polls behind it are dropped
        queue.push(PduCommand::query("show outletgroups"));
        queue.push(PduCommand::query("show inlets"));
        queue.submitPriority(PduCommand::user("power outlets 1 on"));
        check(queue.size() == 1, "queued polls not dropped for a priority command");
        size_t before = transport.writes.size();
        queue.processNext();
        check(transport.writes.size() == before, "priority command jumped an outstanding response");
        queue.completeResponse();
        queue.processNext();
        check(transport.lastWrite() == "power outlets 1 on\r\n", "priority command not sent next");
        check(queue.getOutstanding().userInitiated, "outstanding command lost its user flag");

        // A waiting user command keeps its place ahead of a later priority command
        queue.push(PduCommand::query("show outlets"));
        queue.push(PduCommand::user("power outlets 4 off"));
        queue.submitPriority(PduCommand::user("power outletgroup 2 cycle"));
        check(queue.size() == 2, "queued user command dropped by a priority command");
        queue.completeResponse();
        queue.processNext();
        check(transport.lastWrite() == "power outlets 4 off\r\n", "queued user command lost its turn");
        queue.completeResponse();
        queue.processNext();
        check(transport.lastWrite() == "power outletgroup 2 cycle\r\n", "priority command not sent after the user command");

        // Link down at send time
        uint32_t lost = 0;
        queue.setConnectionLostCallback([&](const PduCommand &)
                                        { lost++; });
        queue.completeResponse();
        transport.connected = false;
        queue.push(PduCommand::query("show inlets"));
        queue.push(PduCommand::query("show outlets"));
        check(!queue.processNext(), "command sent without a connection");
        check(queue.size() == 0, "queue kept commands after the link went down");
        check(lost == 0, "reconnect hook raised for a poll");

        queue.submitPriority(PduCommand::user("power outlets 2 off"));
        queue.processNext();
        check(lost == 1, "reconnect hook not raised for a user command");
        check(!queue.sendReply("y"), "reply sent without a connection");
    }
};

ITestCase *get_test_command_queue()
{
    static Test_CommandQueue inst;
    return &inst;
}
