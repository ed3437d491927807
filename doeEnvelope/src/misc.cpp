#include "misc.hpp"

#include <time.h>
#include <sys/time.h>

/****************************************************************************
 * safeGetline
 * - Works the same as getline, however, can handle issues where the end of
 * line tokens might be either '\n', '\r', or '\n\r'.
 *****************************************************************************/
istream& safeGetline(istream& is, string& t)
{
	t.clear();

	// The sentry object performs various tasks, such as thread synchronization
	// and updating the stream state.
	std::istream::sentry se(is, true);
	std::streambuf* sb = is.rdbuf();

	for(;;) {
		int c = sb->sbumpc();
		switch (c) {
		case '\n':
			return is;
		case '\r':
			if(sb->sgetc() == '\n')
				sb->sbumpc();
			return is;
		case std::streambuf::traits_type::eof():
			// Also handle the case when the last line has no line ending
			if(t.empty())
				is.setstate(std::ios::eofbit);
			return is;
		default:
			t += (char)c;
		}
	}
}

/* The subroutine splits the line of type string along the delimiters into a vector of shorter strings */
vector<string> splitString(string &line, char delimiter) {

	stringstream ss(line);
	string item;
	vector<string> tokens;
	while (getline(ss, item, delimiter)) {
		tokens.push_back(trim(item));
	}
	return tokens;
}//END splitString()

string trim(const string &str) {
	size_t first = str.find_first_not_of(" \t");
	if (first == string::npos)
		return "";
	size_t last = str.find_last_not_of(" \t");
	return str.substr(first, last - first + 1);
}

bool open_file (ifstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool open_file (ofstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

/* Returns false if the field is not a complete number. Empty fields leave value untouched. */
bool parseDouble (const string &field, double &value) {
	string f = trim(field);
	if (f.empty())
		return true;

	char *end;
	double temp = strtod(f.c_str(), &end);
	if (*end != '\0')
		return false;

	value = temp;
	return true;
}

double get_wall_time(){
	struct timeval time;
	if (gettimeofday(&time,NULL)){
		return 0;
	}
	return (double)time.tv_sec + (double)time.tv_usec * .000001;
}
