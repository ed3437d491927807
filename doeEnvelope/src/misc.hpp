#ifndef _MISC_H
#define _MISC_H

#include <iostream>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cmath>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <map>

using namespace std;

// Commonly used functions

/****************************************************************************
 * numToStr
 * - Converts numbers to string
 *****************************************************************************/
template <typename T>
string numToStr (T Number) {
	ostringstream ss;
	ss << Number;
	return ss.str();
}

istream& safeGetline(istream& is, string& t);

vector<string> splitString(string &line, char delimiter);
string trim(const string &str);

bool open_file (ifstream &file, string filename);
bool open_file (ofstream &file, string filename);

bool parseDouble (const string &field, double &value);

double get_wall_time();

#endif
