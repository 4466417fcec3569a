#include <iostream>
#include <iomanip>
#include <algorithm>
#include "fengine_io_internals.hpp"

using namespace std;
using namespace fengine_io;


static void usage()
{
    cerr << "usage: fengine-show-bands [-a ant1,ant2,...] [-t tunings] [-o out.msgpack] [-k] <unit_table.txt> <capture_dir>\n"
	 << "       each unit selected from the table is replayed from <capture_dir>/<snap_hostname>.h5\n"
	 << "       -a: antennas to collate (default: all antennas in the unit table)\n"
	 << "       -t: tunings to collate, e.g. -t ab (default: " << constants::default_tunings << ")\n"
	 << "       -o: write the collation result to a msgpack file\n"
	 << "       -k: print flattened metadata key/value pairs\n";

    exit(2);
}


static void print_band_table(const band_table &t)
{
    cout << t.pair.str() << ": " << t.len() << " band(s)\n";

    for (const frequency_band &b: t.bands) {
	cout << "    [" << b.index << "] channels [" << b.channel_start << "," << b.channel_stop << ")"
	     << " -> " << b.address
	     << "   frequency [" << setprecision(12) << b.frequency_start << ", " << b.frequency_stop << "]\n";
    }
}


int main(int argc, char **argv)
{
    vector<string> antennas;
    string tunings = constants::default_tunings;
    string msgpack_filename;
    bool print_keys = false;
    vector<string> args;

    // Low-budget command line parsing

    for (int i = 1; i < argc; i++) {
	if (!strcmp(argv[i], "-a") && (i+1 < argc))
	    antennas = split_list(argv[++i], ',');
	else if (!strcmp(argv[i], "-t") && (i+1 < argc))
	    tunings = argv[++i];
	else if (!strcmp(argv[i], "-o") && (i+1 < argc))
	    msgpack_filename = argv[++i];
	else if (!strcmp(argv[i], "-k"))
	    print_keys = true;
	else if (argv[i][0] == '-')
	    usage();
	else
	    args.push_back(argv[i]);
    }

    if (args.size() != 2)
	usage();

    unit_table table(args[0]);
    const string capture_dir = args[1];

    if (antennas.size() == 0) {
	for (const unit_table_entry &e: table.entries) {
	    if (std::find(antennas.begin(), antennas.end(), e.antenna) == antennas.end())
		antennas.push_back(e.antenna);
	}
    }

    vector<string> tuning_list;
    for (char c: tunings)
	tuning_list.push_back(string(1,c));

    vector<unit_table_entry> entries = table.select(antennas, tuning_list);

    // Units whose capture file is missing are left out, in the same way as pairs with no configured hardware.
    map<string,double> sky_freqs;

    auto factory = [&](const unit_table_entry &e) -> shared_ptr<fengine_unit> {
	string filename = capture_dir + "/" + e.hostname + ".h5";

	if (!file_exists(filename)) {
	    cerr << ("fengine-show-bands: warning: no capture file " + filename + " for " + e.antenna + e.tuning + "\n");
	    return shared_ptr<fengine_unit> ();
	}

	auto u = make_shared<header_capture_file> (filename);

	if ((u->capture.antenna != e.antenna) || (u->capture.tuning != e.tuning))
	    throw runtime_error(filename + ": capture is for " + u->capture.antenna + u->capture.tuning + ", but unit table says " + e.antenna + e.tuning);

	auto p = sky_freqs.find(e.tuning);
	if (p == sky_freqs.end())
	    sky_freqs[e.tuning] = u->capture.sky_freq;
	else if (p->second != u->capture.sky_freq)
	    cerr << ("fengine-show-bands: warning: " + filename + ": sky frequency of tuning " + e.tuning + " differs from earlier capture, using earlier value\n");

	return u;
    };

    unit_map units = make_unit_map(entries, factory);
    collation_result result = collate_band_tables(units, sky_freqs);

    for (const auto &kv: result.band_tables)
	print_band_table(kv.second);
    for (const auto &kv: result.unavailable)
	cout << kv.first.str() << ": unavailable (" << kv.second << ")\n";
    for (const auto &kv: result.failures)
	cout << kv.first.str() << ": FAILED: " << kv.second << "\n";

    if (print_keys) {
	for (const metadata_value &v: flatten_band_tables(result))
	    cout << v.key << " = " << v.value_str() << "   (" << v.type_name() << ")\n";
    }

    if (msgpack_filename.size() > 0) {
	result.write_msgpack_file(msgpack_filename);
	cerr << ("wrote " + msgpack_filename + "\n");
    }

    return (result.failures.size() > 0) ? 1 : 0;
}
