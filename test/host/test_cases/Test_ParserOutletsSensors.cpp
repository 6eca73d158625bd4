/**
 * TestCase: Test_ParserOutletsSensors
 *
 * Goal:
 *   Outlet state lines and sensor readings, each field independent of the
 *   others so one malformed line does not hide the rest.
 */

#include <string>
#include "TestCase.h"
#include "control_panel.h"
#include "response_parser.h"

static const char *MIXED_OUTPUT =
    "show outlets\r\n"
    "  RMS Current: 3.45 A\r\n"
    "  Reading: 412.00 W\r\n"
    "  Reading: 399.00 W\r\n"
    "  Reading: 22.10 deg C\r\n"
    "  Reading: 45 %\r\n"
    "Outlet 3 - Server Rack: Power state: On\r\n"
    "Outlet 4: Power state: Off\r\n"
    "Outlet 99 - Bogus: Power state: On\r\n"
    "Outlet 5 - Broken line\r\n"
    "Outlet 6 - Printer: Power state: Off\r\n"
    "[My PDU] #";

class Test_ParserOutletsSensors : public BasicTestCase
{
public:
    const char *name() const override { return "Parser: outlet lines and sensor readings"; }

protected:
    void run() override
    {
        ParsedResponse parsed = ResponseParser::parse(MIXED_OUTPUT);

        const SensorReadings &sensors = parsed.sensors;
        check(sensors.hasCurrent && sensors.current == "3.45 A", "current reading: '" + sensors.current + "'");
        check(sensors.hasActivePower && sensors.activePower == "412.00 W", "first W reading must win: '" +
                                                                             sensors.activePower + "'");
        check(sensors.temperature == "22.10 \xC2\xB0" "C", "temperature reading: '" + sensors.temperature + "'");
        check(sensors.humidity == "45 %", "humidity reading: '" + sensors.humidity + "'");

        if (!check(parsed.outlets.size() == 3, "expected outlets 3, 4 and 6, got " +
                                                   std::to_string(parsed.outlets.size())))
        {
            return;
        }
        check(parsed.outlets[0].index == 3 && parsed.outlets[0].name == "Server Rack" && parsed.outlets[0].powered,
              "outlet 3 line");
        check(parsed.outlets[1].index == 4 && parsed.outlets[1].name.empty() && !parsed.outlets[1].powered,
              "outlet 4 line without a name");
        check(parsed.outlets[2].index == 6 && parsed.outlets[2].name == "Printer", "outlet after a broken line");
        check(!parsed.isGroupListing, "outlet output treated as a group listing");

        ControlPanel panel;
        ResponseParser::apply(parsed, panel, ApplyContext());
        check(panel.getOutlet(3).known && panel.getOutlet(3).powered, "outlet 3 not applied");
        check(panel.getOutlet(3).name == "Server Rack", "outlet 3 name not applied");
        check(!panel.getOutlet(5).known, "broken outlet line applied");
        check(panel.sensors().current == "3.45 A", "sensor display not updated");

        ControlPanel reverting;
        ApplyContext guard;
        guard.revertingState = true;
        ResponseParser::apply(parsed, reverting, guard);
        check(!reverting.getOutlet(3).known, "outlet updated during revert");
        check(reverting.sensors().humidity == "45 %", "sensors must still update during revert");
    }
};

ITestCase *get_test_parser_outlets_sensors()
{
    static Test_ParserOutletsSensors inst;
    return &inst;
}
