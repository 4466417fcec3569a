#include "fengine_io_internals.hpp"

using namespace std;
using namespace fengine_io;


static const char *unit_table_text =
    "# F-Engine unit table\n"
    "# r\xc3\xa9vis\xc3\xa9 2026-10\n"
    "ANT_name  LO   snap_hostname   notes\n"
    "\n"
    "1a        a    rfsoc1-ctrl-1   \xc3\xa9tage\n"
    "1a        b    rfsoc1-ctrl-2\n"
    "   # a comment after whitespace\n"
    "2b        a    rfsoc2-ctrl-1   spare   extra\n"
    "2b        c    rfsoc2-ctrl-3\n"
    "3c        a    rfsoc3-ctrl-1\n";


static void test_unit_table()
{
    cerr << "test_unit_table()";

    istringstream in(unit_table_text);
    unit_table t("test-units.txt", in);

    if (t.entries.size() != 5)
	throw runtime_error("test_unit_table: expected 5 entries, got " + to_string(t.entries.size()));

    const unit_table_entry &e = t.entries[3];
    if ((e.antenna != "2b") || (e.tuning != "c") || (e.hostname != "rfsoc2-ctrl-3") || (e.pipeline_id != 2))
	throw runtime_error("test_unit_table: entry 3 parsed incorrectly");
    if (t.entries[0].pipeline_id != 0)
	throw runtime_error("test_unit_table: expected pipeline_id 0 for rfsoc1-ctrl-1");

    vector<unit_table_entry> sel = t.select({ "1a", "2b" }, { "a", "c", "d" });

    if (sel.size() != 3)
	throw runtime_error("test_unit_table: select() returned " + to_string(sel.size()) + " entries, expected 3");
    if ((sel[0].hostname != "rfsoc1-ctrl-1") || (sel[1].hostname != "rfsoc2-ctrl-1") || (sel[2].hostname != "rfsoc2-ctrl-3"))
	throw runtime_error("test_unit_table: select() returned wrong entries, or in wrong order");

    if (t.select({ "9z" }, { "a" }).size() != 0)
	throw runtime_error("test_unit_table: select() of unknown antenna should be empty");

    // Rows may start with a non-ASCII (UTF-8) byte.
    istringstream in2("ANT_name LO snap_hostname\n\xc3\xa9" "1 a rfsoc4-ctrl-1\n");
    unit_table t2("test-units-utf8.txt", in2);

    if ((t2.entries.size() != 1) || (t2.entries[0].antenna != "\xc3\xa9" "1") || (t2.entries[0].pipeline_id != 0))
	throw runtime_error("test_unit_table: row starting with a non-ASCII byte parsed incorrectly");

    cerr << "success\n";
}


static void check_parse_fails(const string &text, const string &what)
{
    istringstream in(text);
    bool threw = false;

    try {
	unit_table t("bad-units.txt", in);
    } catch (runtime_error &e) {
	threw = true;
	if (string(e.what()).find("bad-units.txt") == string::npos)
	    throw runtime_error("test_unit_table_errors: " + what + ": error message doesn't name the file");
    }

    if (!threw)
	throw runtime_error("test_unit_table_errors: " + what + ": expected exception");
}


static void test_unit_table_errors()
{
    cerr << "test_unit_table_errors()";

    check_parse_fails("", "empty table");
    check_parse_fails("# only comments\n\n", "comment-only table");
    check_parse_fails("ANT_name LO hostname\n1a a rfsoc1-ctrl-1\n", "missing snap_hostname column");
    check_parse_fails("ANT_name LO snap_hostname\n1a a\n", "short row");
    check_parse_fails("ANT_name LO snap_hostname\n1a a rfsoc1-ctrl-x\n", "hostname without pipeline number");

    bool threw = false;
    try {
	unit_table t("/nonexistent/fengine-units.txt", false);
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_unit_table_errors: missing file should throw");

    cerr << "success\n";
}


static void test_antenna_tuning()
{
    cerr << "test_antenna_tuning()";

    antenna_tuning a("1a", "b");
    antenna_tuning b("1a", "c");
    antenna_tuning c("2b", "a");

    if (a.str() != "1ab")
	throw runtime_error("test_antenna_tuning: str() returned '" + a.str() + "'");
    if (!(a < b) || !(b < c) || !(a < c))
	throw runtime_error("test_antenna_tuning: operator< isn't ordered by (antenna, tuning)");
    if ((b < a) || (a < a))
	throw runtime_error("test_antenna_tuning: operator< isn't a strict ordering");
    if (!(a == antenna_tuning("1a", "b")) || (a == b))
	throw runtime_error("test_antenna_tuning: operator== is wrong");

    // Antenna is compared first.
    if (!(antenna_tuning("1a", "z") < antenna_tuning("1b", "a")))
	throw runtime_error("test_antenna_tuning: antenna should be compared before tuning");

    cerr << "success\n";
}


static void test_metadata_value()
{
    cerr << "test_metadata_value()";

    metadata_value b = metadata_value::make_bool("x.enabled", true);
    metadata_value n = metadata_value::make_int("x.offset", -3);
    metadata_value u = metadata_value::make_int("x.len", 7);
    metadata_value f = metadata_value::make_float("x.freq", 0.1);
    metadata_value s = metadata_value::make_string("x.address", "10.0.0.1");

    if (string(b.type_name()) != "u32" || (b.value_str() != "1"))
	throw runtime_error("test_metadata_value: bool should be u32 1");
    if (string(n.type_name()) != "i64" || (n.value_str() != "-3"))
	throw runtime_error("test_metadata_value: negative int should be i64");
    if (string(u.type_name()) != "u64" || (u.value_str() != "7"))
	throw runtime_error("test_metadata_value: non-negative int should be u64");
    if (string(s.type_name()) != "string" || (s.value_str() != "10.0.0.1"))
	throw runtime_error("test_metadata_value: bad string value");
    if (string(f.type_name()) != "f64" || (lexical_cast<double> (f.value_str()) != 0.1))
	throw runtime_error("test_metadata_value: f64 value doesn't round-trip through value_str()");

    cerr << "success\n";
}


int main(int argc, char **argv)
{
    test_lexical_cast();
    test_unit_table();
    test_unit_table_errors();
    test_antenna_tuning();
    test_metadata_value();

    return 0;
}
