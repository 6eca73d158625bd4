/**
 * TestCase: Test_ReconnectExhaustion
 *
 * Goal:
 *   An unreachable PDU gets five backoff attempts after the initial
 *   connect, then the session gives up and says so.
 *
 * Expected behavior:
 *   - Status "Max Reconnect Attempts Reached" within the backoff window.
 *   - Six transport connects in total, and no seventh later on.
 *
 * Runs one simulated second per runner tick.
 */

#include <memory>
#include "TestBench.h"
#include "TestCase.h"

class Test_ReconnectExhaustion : public ITestCase
{
public:
    const char *name() const override { return "Session: reconnect attempts exhausted"; }

    void enter(uint32_t /*nowMs*/) override
    {
        _verdict = TestVerdict::Running;
        _detail = "connecting";
        _ticks = 0;
        _phase = Phase::Backoff;

        _bench.reset(new TestBench());
        _pdu = &_bench->add(TestBench::makeConfig("pdu1"));
        _pdu->transport.acceptConnect = false;

        if (_pdu->session->connect(true))
        {
            fail("connect reported success on a refused transport");
            return;
        }
        if (_pdu->session->getPanel().getStatus() != "Connection Failed")
        {
            fail("status after refused connect: " + _pdu->session->getPanel().getStatus());
            return;
        }
        _detail = "waiting for attempts to run out";
    }

    void tick(uint32_t /*nowMs*/) override
    {
        _ticks++;
        _bench->advance(kTickMs);
        PduSession &session = *_pdu->session;

        switch (_phase)
        {
        case Phase::Backoff:
            if (session.getPanel().getStatus() != "Max Reconnect Attempts Reached")
            {
                if (_ticks > kMaxBackoffTicks)
                {
                    fail("timeout");
                }
                return;
            }
            if (_pdu->transport.connectCalls != 1 + MAX_RECONNECT_ATTEMPTS)
            {
                fail("connect calls: " + std::to_string(_pdu->transport.connectCalls));
                return;
            }
            if (session.getReconnect().isPending())
            {
                fail("attempt scheduled past the limit");
                return;
            }
            _quietUntilTick = _ticks + kQuietTicks;
            _detail = "checking nothing else is attempted";
            _phase = Phase::Quiet;
            return;

        case Phase::Quiet:
            if (_pdu->transport.connectCalls != 1 + MAX_RECONNECT_ATTEMPTS)
            {
                fail("attempt after exhaustion");
                return;
            }
            if (_ticks >= _quietUntilTick)
            {
                _verdict = TestVerdict::Pass;
                _detail = "ok";
            }
            return;
        }
    }

    void exit(uint32_t /*nowMs*/) override
    {
        _pdu = nullptr;
        _bench.reset();
    }

    TestVerdict verdict() const override { return _verdict; }
    const char *detail() const override { return _detail.c_str(); }

    void dump() const override
    {
        std::printf("----------------------------------------------\n");
        std::printf("- TestCase: %s\n", name());
        std::printf("- %s\n", verdictToString(_verdict));
        std::printf("- Detail: %s\n", _detail.c_str());
        std::printf("- Simulated seconds: %u\n", (unsigned)_ticks);
        std::printf("----------------------------------------------\n");
    }

private:
    enum class Phase : uint8_t
    {
        Backoff,
        Quiet
    };

    // Worst case backoff is 2+4+8+16+32 s plus five 2 s jitters
    static constexpr uint32_t kTickMs = 1000;
    static constexpr uint32_t kMaxBackoffTicks = 90;
    static constexpr uint32_t kQuietTicks = 120;

    std::unique_ptr<TestBench> _bench;
    BenchEndpoint *_pdu = nullptr;

    Phase _phase = Phase::Backoff;
    uint32_t _ticks = 0;
    uint32_t _quietUntilTick = 0;

    TestVerdict _verdict = TestVerdict::Running;
    std::string _detail = "init";

    void fail(const std::string &why)
    {
        _verdict = TestVerdict::Fail;
        _detail = why;
    }
};

ITestCase *get_test_reconnect_exhaustion()
{
    static Test_ReconnectExhaustion inst;
    return &inst;
}
