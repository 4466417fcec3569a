#include <iostream>
#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


inline string _iface_group_name(int iface)
{
    return "iface" + to_string(iface);
}


// Helper function for header_capture_file constructor
static void _read_unit_group(header_capture &c, const hdf5_file &f)
{
    hdf5_group g(f, "unit");

    vector<string> identity;
    g.read_string_dataset("identity", identity, 3);

    c.antenna = identity[0];
    c.tuning = identity[1];
    c.hostname = identity[2];
    c.nchan_tot = g.read_attribute<int> ("nchan_tot");
    c.chan_bw = g.read_attribute<double> ("chan_bw");
    c.sky_freq = g.read_attribute<double> ("sky_freq");

    int ninterfaces = g.read_attribute<int> ("ninterfaces");
    if (ninterfaces < 0)
	throw runtime_error(f.filename + ": expected ninterfaces >= 0");
    if (c.nchan_tot <= 0)
	throw runtime_error(f.filename + ": expected nchan_tot > 0");

    if ((ninterfaces > 0) && (!g.has_dataset("eth_ctrl") || !g.has_dataset("eth_ctrl_ok")))
	throw runtime_error(f.filename + ": ninterfaces=" + to_string(ninterfaces) + ", but no 'eth_ctrl' or 'eth_ctrl_ok' dataset was captured");

    g.read_dataset("eth_ctrl", c.eth_ctrl, ninterfaces);
    g.read_dataset("eth_ctrl_ok", c.eth_ctrl_ok, ninterfaces);
}


// Helper function for header_capture_file constructor
static void _read_iface_group(header_capture &c, const hdf5_file &f, int iface)
{
    hdf5_group g(f, _iface_group_name(iface));

    int nheaders = g.read_attribute<int> ("nheaders");
    if (nheaders < 0)
	throw runtime_error(f.filename + ": " + g.group_name + ": expected nheaders >= 0");

    vector<header_record> &headers = c.headers[iface];
    headers.resize(nheaders);

    if (nheaders == 0)
	return;

    vector<unsigned char> valid, first, is_8bit;
    vector<int> chans, n_chans;
    vector<string> dest;

    g.read_dataset("valid", valid, nheaders);
    g.read_dataset("first", first, nheaders);
    g.read_dataset("is_8bit", is_8bit, nheaders);
    g.read_dataset("chans", chans, nheaders);
    g.read_dataset("n_chans", n_chans, nheaders);
    g.read_string_dataset("dest", dest, nheaders);

    for (int i = 0; i < nheaders; i++) {
	headers[i].valid = valid[i];
	headers[i].first = first[i];
	headers[i].dest = dest[i];
	headers[i].chans = chans[i];
	headers[i].n_chans = n_chans[i];
	headers[i].is_8bit = is_8bit[i];
    }
}


header_capture_file::header_capture_file(const string &filename_, bool noisy) :
    filename(filename_)
{
    hdf5_file f(filename);

    _read_unit_group(capture, f);

    int niface_captured = 0;

    for (unsigned int iface = 0; iface < capture.eth_ctrl.size(); iface++) {
	if (!f.has_group(_iface_group_name(iface)))
	    continue;
	_read_iface_group(capture, f, iface);
	niface_captured++;
    }

    if (noisy) {
	cerr << ("read " + filename + ": " + capture.antenna + capture.tuning + " (" + capture.hostname + "), "
		 + to_string(capture.eth_ctrl.size()) + " interface(s), " + to_string(niface_captured) + " with headers\n");
    }
}


bool header_capture_file::read_interface_enabled(int iface, bool &enabled)
{
    if (!connected)
	throw runtime_error("fengine_io: header_capture_file::read_interface_enabled() called after disconnect()");
    if ((iface < 0) || (iface >= (int)capture.eth_ctrl.size()))
	throw runtime_error("fengine_io: header_capture_file::read_interface_enabled(): interface index " + to_string(iface) + " is out of range");

    if (!capture.eth_ctrl_ok[iface])
	return false;

    enabled = (capture.eth_ctrl[iface] & constants::eth_ctrl_enable_bit) != 0;
    return true;
}


bool header_capture_file::read_headers(int iface, vector<header_record> &headers)
{
    if (!connected)
	throw runtime_error("fengine_io: header_capture_file::read_headers() called after disconnect()");
    if ((iface < 0) || (iface >= (int)capture.eth_ctrl.size()))
	throw runtime_error("fengine_io: header_capture_file::read_headers(): interface index " + to_string(iface) + " is out of range");

    auto p = capture.headers.find(iface);
    if (p == capture.headers.end())
	return false;

    headers = p->second;
    return true;
}


void header_capture_file::disconnect() noexcept
{
    this->connected = false;
}


// -------------------------------------------------------------------------------------------------


void write_header_capture_file(const string &filename, const header_capture &c, bool clobber)
{
    if (c.eth_ctrl_ok.size() != c.eth_ctrl.size())
	throw runtime_error(filename + ": header_capture has " + to_string(c.eth_ctrl.size()) + " eth_ctrl value(s), but "
			    + to_string(c.eth_ctrl_ok.size()) + " eth_ctrl_ok flag(s)");

    hdf5_file f(filename, true, clobber);

    {
	hdf5_group g(f, "unit", true);

	vector<string> identity = { c.antenna, c.tuning, c.hostname };
	g.write_string_dataset("identity", identity);
	g.write_attribute("nchan_tot", c.nchan_tot);
	g.write_attribute("chan_bw", c.chan_bw);
	g.write_attribute("sky_freq", c.sky_freq);
	g.write_attribute("ninterfaces", (int)c.eth_ctrl.size());

	if (c.eth_ctrl.size() > 0) {
	    g.write_dataset("eth_ctrl", c.eth_ctrl);
	    g.write_dataset("eth_ctrl_ok", c.eth_ctrl_ok);
	}
    }

    for (const auto &kv: c.headers) {
	int iface = kv.first;
	const vector<header_record> &headers = kv.second;
	int nheaders = headers.size();

	if ((iface < 0) || (iface >= (int)c.eth_ctrl.size()))
	    throw runtime_error(filename + ": header table for interface " + to_string(iface) + " is out of range");

	hdf5_group g(f, _iface_group_name(iface), true);
	g.write_attribute("nheaders", nheaders);

	if (nheaders == 0)
	    continue;

	vector<unsigned char> valid(nheaders), first(nheaders), is_8bit(nheaders);
	vector<int> chans(nheaders), n_chans(nheaders);
	vector<string> dest(nheaders);

	for (int i = 0; i < nheaders; i++) {
	    valid[i] = headers[i].valid ? 1 : 0;
	    first[i] = headers[i].first ? 1 : 0;
	    is_8bit[i] = headers[i].is_8bit ? 1 : 0;
	    chans[i] = headers[i].chans;
	    n_chans[i] = headers[i].n_chans;
	    dest[i] = headers[i].dest;
	}

	g.write_dataset("valid", valid);
	g.write_dataset("first", first);
	g.write_dataset("is_8bit", is_8bit);
	g.write_dataset("chans", chans);
	g.write_dataset("n_chans", n_chans);
	g.write_string_dataset("dest", dest);
    }
}


}  // namespace fengine_io
