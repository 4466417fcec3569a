//
// This file defines
//
//   template<typename T> bool lexical_cast(const std::string &x, T &ret);
//
// which converts a string to type T, returning false on failure.  Currently the following types T
// are supported:
//
//   string  (trivial)
//   long
//   int
//   double
//
// The throwing version lexical_cast<T>(x) is an inline wrapper in fengine_io.hpp.
//

#include <stdlib.h>
#include <limits.h>
#include <math.h>
#include <iostream>
#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


template<> const char *typestr<string>() { return "string"; }
template<> const char *typestr<long>() { return "long"; }
template<> const char *typestr<int>() { return "int"; }
template<> const char *typestr<double>() { return "double"; }


// trivial case: convert string -> string
template<> bool lexical_cast<string> (const string &x, string &ret)
{
    ret = x;
    return true;
}


inline bool is_all_spaces(const char *s)
{
    if (!s)
	throw runtime_error("fengine_io: NULL pointer passed to is_all_spaces()");

    for (;;) {
	if (!*s)
	    return true;
	if (!isspace((unsigned char) *s))
	    return false;
	s++;
    }
}


template<> bool lexical_cast<long> (const string &x, long &ret)
{
    const char *ptr = x.c_str();
    char *endptr = NULL;

    errno = 0;
    long val = strtol(ptr, &endptr, 10);

    if ((endptr == ptr) || (errno == ERANGE) || !is_all_spaces(endptr))
	return false;

    ret = val;
    return true;
}


template<> bool lexical_cast<int> (const string &x, int &ret)
{
    long val = 0;

    if (!lexical_cast<long> (x, val))
	return false;
    if ((val < INT_MIN) || (val > INT_MAX))
	return false;

    ret = val;
    return true;
}


template<> bool lexical_cast<double> (const string &x, double &ret)
{
    const char *ptr = x.c_str();
    char *endptr = NULL;

    errno = 0;
    double val = strtod(ptr, &endptr);

    if ((endptr == ptr) || (errno == ERANGE) || !is_all_spaces(endptr))
	return false;

    ret = val;
    return true;
}


vector<string> split_list(const string &s, char delim)
{
    vector<string> ret;
    string::size_type pos = 0;

    while (pos <= s.size()) {
	string::size_type end = s.find(delim, pos);
	if (end == string::npos)
	    end = s.size();
	if (end > pos)
	    ret.push_back(s.substr(pos, end-pos));
	pos = end + 1;
    }

    return ret;
}


// -------------------------------------------------------------------------------------------------
//
// Unit test


template<typename T>
static void check_convert(const string &x, T y)
{
    T ret;

    if (!lexical_cast<T> (x, ret))
	throw runtime_error("test_lexical_cast(): failed to convert '" + x + "' to " + typestr<T>());
    if (fabs(double(ret) - double(y)) > 1.0e-5 * max(1.0, fabs(double(y))))
	throw runtime_error("test_lexical_cast(): didn't correctly convert '" + x + "'");
}


template<typename T>
static void check_convert_fails(const string &x)
{
    T ret;

    if (lexical_cast<T> (x, ret))
	throw runtime_error("test_lexical_cast(): conversion of '" + x + "' to " + typestr<T>() + " should have failed");
}


void test_lexical_cast()
{
    check_convert<int>("0", 0);
    check_convert<int>("-0", 0);
    check_convert<int>("12", 12);
    check_convert<int>("-123", -123);
    check_convert<int>(" \t 1234  \n\t", 1234);

    check_convert_fails<int>("");
    check_convert_fails<int>("  ");
    check_convert_fails<int>("oops");
    check_convert_fails<int>(" oops ");
    check_convert_fails<int>("1234abc");
    check_convert_fails<int>("1234 abc");
    check_convert_fails<int>("0.1");
    check_convert_fails<int>("99999999999999999999");

    check_convert<long>("4294967296", 4294967296L);
    check_convert_fails<long>("1e3");

    check_convert<double>("1.23", 1.23);
    check_convert<double>("-1.23e-5", -1.23e-5);
    check_convert<double>("-5", -5.0);
    check_convert<double>(".23", 0.23);
    check_convert<double>("-.034e3", -0.034e3);
    check_convert<double>("  0.03e20  ", 0.03e20);
    check_convert<double>("1420.405751768", 1420.405751768);

    check_convert_fails<double>("");
    check_convert_fails<double>("  ");
    check_convert_fails<double>("oops");
    check_convert_fails<double>(" oops ");
    check_convert_fails<double>("5x");
    check_convert_fails<double>("-1.3e20x");

    string s;
    if (!lexical_cast<string> ("1c", s) || (s != "1c"))
	throw runtime_error("test_lexical_cast(): string conversion failed");

    if (lexical_cast<int> ("17") != 17)
	throw runtime_error("test_lexical_cast(): throwing version returned wrong value");

    bool threw = false;
    try {
	lexical_cast<double> ("nope");
    } catch (runtime_error &) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_lexical_cast(): throwing version didn't throw");

    vector<string> v = split_list("1a,,2b,", ',');
    if ((v.size() != 2) || (v[0] != "1a") || (v[1] != "2b"))
	throw runtime_error("test_lexical_cast(): split_list() returned " + vstr(v));
    if (split_list("", ',').size() != 0)
	throw runtime_error("test_lexical_cast(): split_list(\"\") should be empty");

    cerr << "test_lexical_cast(): success\n";
}


}   // namespace fengine_io
