#include <fstream>
#include <algorithm>
#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


inline bool _is_comment_or_blank(const string &line)
{
    for (char c: line) {
	if (c == '#')
	    return true;
	if (!isspace((unsigned char) c))
	    return false;
    }
    return true;
}

inline vector<string> _tokenize(const string &line)
{
    vector<string> ret;
    stringstream ss(line);
    string tok;

    while (ss >> tok)
	ret.push_back(tok);

    return ret;
}

inline int _column_index(const string &filename, const vector<string> &header, const string &column_name)
{
    auto p = std::find(header.begin(), header.end(), column_name);
    if (p == header.end())
	throw runtime_error(filename + ": unit table has no '" + column_name + "' column");
    return p - header.begin();
}

inline bool _contains(const vector<string> &v, const string &x)
{
    return std::find(v.begin(), v.end(), x) != v.end();
}


unit_table::unit_table(const string &filename_, bool noisy) :
    filename(filename_)
{
    ifstream f(filename);
    if (!f)
	throw runtime_error(filename + ": couldn't open unit table: " + strerror(errno));

    this->_parse(f);

    if (noisy)
	cerr << ("read " + filename + ", " + to_string(entries.size()) + " unit(s)\n");
}


unit_table::unit_table(const string &filename_, istream &in) :
    filename(filename_)
{
    this->_parse(in);
}


void unit_table::_parse(istream &in)
{
    vector<string> header;
    int ant_col = -1;
    int lo_col = -1;
    int host_col = -1;
    int ncols_min = 0;

    string line;
    int lineno = 0;

    while (getline(in, line)) {
	lineno++;

	if (_is_comment_or_blank(line))
	    continue;

	vector<string> tokens = _tokenize(line);

	if (header.size() == 0) {
	    header = tokens;
	    ant_col = _column_index(filename, header, "ANT_name");
	    lo_col = _column_index(filename, header, "LO");
	    host_col = _column_index(filename, header, "snap_hostname");
	    ncols_min = max(ant_col, max(lo_col, host_col)) + 1;
	    continue;
	}

	if ((int)tokens.size() < ncols_min)
	    throw runtime_error(filename + ":" + to_string(lineno) + ": expected at least " + to_string(ncols_min) + " columns, got " + to_string(tokens.size()));

	unit_table_entry e;
	e.antenna = tokens[ant_col];
	e.tuning = tokens[lo_col];
	e.hostname = tokens[host_col];

	// Hostnames end in the (one-based) pipeline number, e.g. "rfsoc2-ctrl-1".
	int n = 0;
	if (!lexical_cast(e.hostname.substr(e.hostname.size()-1), n))
	    throw runtime_error(filename + ":" + to_string(lineno) + ": hostname '" + e.hostname + "' doesn't end in a pipeline number");

	e.pipeline_id = n - 1;
	entries.push_back(e);
    }

    if (header.size() == 0)
	throw runtime_error(filename + ": unit table is empty (no header row)");
}


vector<unit_table_entry> unit_table::select(const vector<string> &antennas, const vector<string> &tunings) const
{
    vector<unit_table_entry> ret;

    for (const unit_table_entry &e: entries) {
	if (_contains(antennas, e.antenna) && _contains(tunings, e.tuning))
	    ret.push_back(e);
    }

    return ret;
}


}  // namespace fengine_io
