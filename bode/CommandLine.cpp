/***********************************************************************************************************************
*                                                                                                                      *
* libbodehal                                                                                                           *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Implementation of CommandLine
 */

#include "CommandLine.h"
#include <errno.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parsing

/**
	@brief Parses everything after the program name

	A --config file is loaded before any other option is applied, wherever it appears, so the rest of the command line
	overrides it.
 */
CommandLine::ParseStatus CommandLine::Parse(const vector<string>& args, SweepConfiguration& config)
{
	static const set<string> valueOptions =
	{
		"--config",
		"--ds_ip",
		"--awg_port",
		"--awg_voltage",
		"--output",
		"--plot",
		"--step_time",
		"--retries"
	};

	vector<string> flags;
	vector<pair<string, string>> options;
	vector<string> positional;

	for(size_t i=0; i<args.size(); i++)
	{
		auto& s = args[i];

		if(s == "--help")
			return PARSE_HELP;

		else if( (s == "--phase") || (s == "--linear") || (s == "--no_smoothing") || (s == "--no_plot") ||
			(s == "--use_manual_settings") || (s == "--demo") )
		{
			flags.push_back(s);
		}

		else if(valueOptions.find(s) != valueOptions.end())
		{
			if(i+1 >= args.size())
			{
				LogError("Missing value for \"%s\"\n", s.c_str());
				return PARSE_ERROR;
			}
			options.push_back(make_pair(s, args[i+1]));
			i++;
		}

		else if( (s.length() > 1) && (s[0] == '-') )
		{
			LogError("Unrecognized command-line argument \"%s\", use --help\n", s.c_str());
			return PARSE_ERROR;
		}
		else
			positional.push_back(s);
	}

	bool haveConfig = false;
	for(auto& o : options)
	{
		if(o.first != "--config")
			continue;
		if(!config.Load(o.second))
			return PARSE_ERROR;
		haveConfig = true;
	}

	bool noPlot = false;
	for(auto& f : flags)
	{
		if(f == "--phase")
			config.m_phase = true;
		else if(f == "--linear")
			config.m_linear = true;
		else if(f == "--no_smoothing")
			config.m_smoothing = false;
		else if(f == "--no_plot")
			noPlot = true;
		else if(f == "--use_manual_settings")
			config.m_manualSettings = true;
		else if(f == "--demo")
			config.m_demo = true;
	}

	for(auto& o : options)
	{
		if(!ApplyOption(o.first, o.second, config))
			return PARSE_ERROR;
	}

	if(noPlot)
		config.m_plotPath = "";

	//Frequency plan, may come from the config file instead
	if(positional.empty() && haveConfig)
		return PARSE_OK;
	if( (positional.size() < 2) || (positional.size() > 3) )
	{
		LogError("Expected MIN_FREQ MAX_FREQ [FREQ_COUNT], use --help\n");
		return PARSE_ERROR;
	}
	Unit hz(Unit::UNIT_HZ);
	config.m_minFrequency = hz.ParseString(positional[0]);
	config.m_maxFrequency = hz.ParseString(positional[1]);
	if(std::isnan(config.m_minFrequency) || std::isnan(config.m_maxFrequency))
	{
		LogError("Bad frequency \"%s\" or \"%s\"\n", positional[0].c_str(), positional[1].c_str());
		return PARSE_ERROR;
	}
	if( (positional.size() == 3) && !ParseCount(positional[2], config.m_points) )
	{
		LogError("Bad point count \"%s\"\n", positional[2].c_str());
		return PARSE_ERROR;
	}

	return PARSE_OK;
}

bool CommandLine::ApplyOption(const string& name, const string& value, SweepConfiguration& config)
{
	if(name == "--ds_ip")
		config.m_scopeAddress = value;
	else if(name == "--awg_port")
		config.m_generatorPort = value;
	else if(name == "--output")
		config.m_csvPath = value;
	else if(name == "--plot")
		config.m_plotPath = value;

	else if(name == "--awg_voltage")
	{
		double v;
		if(!ParseDouble(value, v) || (v <= 0))
		{
			LogError("Bad amplitude \"%s\", expected a positive voltage\n", value.c_str());
			return false;
		}
		config.m_amplitude = v;
	}
	else if(name == "--step_time")
	{
		if(!ParseUnsigned(value, config.m_stepTimeMs))
		{
			LogError("Bad step time \"%s\", expected milliseconds\n", value.c_str());
			return false;
		}
	}
	else if(name == "--retries")
	{
		if(!ParseUnsigned(value, config.m_retries))
		{
			LogError("Bad retry count \"%s\"\n", value.c_str());
			return false;
		}
	}

	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Numbers

/**
	@brief Parses a non-negative decimal integer that fits in an unsigned int

	Signs, surrounding text and out of range values are rejected. strtoul alone would wrap "-1" around to UINT_MAX.
 */
bool CommandLine::ParseUnsigned(const string& str, unsigned int& value)
{
	if(str.empty() || !isdigit(static_cast<unsigned char>(str[0])))
		return false;

	errno = 0;
	char* end = nullptr;
	unsigned long n = strtoul(str.c_str(), &end, 10);
	if( (*end != '\0') || (errno == ERANGE) || (n > UINT_MAX) )
		return false;

	value = n;
	return true;
}

/**
	@brief Parses a point count, which has to be at least 1
 */
bool CommandLine::ParseCount(const string& str, size_t& count)
{
	unsigned int n;
	if(!ParseUnsigned(str, n) || (n == 0))
		return false;
	count = n;
	return true;
}

bool CommandLine::ParseDouble(const string& str, double& value)
{
	if(str.empty())
		return false;

	char* end = nullptr;
	double d = strtod(str.c_str(), &end);
	if( (end == str.c_str()) || (*end != '\0') || !std::isfinite(d) )
		return false;

	value = d;
	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Help

void CommandLine::ShowUsage()
{
	fprintf(stderr,
		"Usage: bode [options] MIN_FREQ MAX_FREQ [FREQ_COUNT]\n"
		"\n"
		"Measures the frequency response of a DUT driven by a function generator and probed by an oscilloscope.\n"
		"Frequencies accept SI suffixes, e.g. 1k or 2.2M. FREQ_COUNT defaults to 50.\n"
		"With --config the frequencies may be left out and are taken from the file.\n"
		"\n"
		"Options:\n"
		"  --ds_ip <addr[:port]>    Scope address, port 5555 by default. \"auto\" searches the network\n"
		"  --awg_port <path>        Generator serial port (default /dev/ttyUSB0)\n"
		"  --awg_voltage <V>        Generator amplitude in volts peak-to-peak (default 5)\n"
		"  --phase                  Measure phase as well as gain\n"
		"  --output <path>          Write results as CSV\n"
		"  --plot <path>            Write the plot to this PNG file (default bode.png)\n"
		"  --no_plot                Do not draw a plot\n"
		"  --linear                 Linear instead of logarithmic frequency spacing\n"
		"  --step_time <ms>         Settle time after each frequency change\n"
		"  --no_smoothing           No smoothed curve on the plot\n"
		"  --use_manual_settings    Never change the scope's scale or timebase\n"
		"  --retries <n>            Retries after clipping or a trigger timeout (default 2)\n"
		"  --config <file.yml>      Load settings from a YAML file\n"
		"  --demo                   Use simulated instruments\n"
		"  --help                   Show this message\n"
		"\n"
		"Logging: --quiet, --verbose, --debug, --trace <class>, -l <file>, -L <file>\n");
}
