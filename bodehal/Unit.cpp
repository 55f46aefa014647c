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
	@brief Implementation of Unit
 */

#include "bodehal.h"

using namespace std;

/**
	@brief Gets the appropriate SI scaling factor for a number.
 */
void Unit::GetSIScalingFactor(double num, double& scaleFactor, string& prefix) const
{
	scaleFactor = 1;
	prefix = "";
	num = fabs(num);

	if( (m_type == UNIT_DB) || (m_type == UNIT_DEGREES) || (num == 0) )
		return;

	if(num >= 1e12)
	{
		scaleFactor = 1e-12;
		prefix = "T";
	}
	else if(num >= 1e9)
	{
		scaleFactor = 1e-9;
		prefix = "G";
	}
	else if(num >= 1e6)
	{
		scaleFactor = 1e-6;
		prefix = "M";
	}
	else if(num >= 1e3)
	{
		scaleFactor = 1e-3;
		prefix = "k";
	}
	else if(num >= 1)
	{}
	else if(num >= 1e-3)
	{
		scaleFactor = 1e3;
		prefix = "m";
	}
	else if(num >= 1e-6)
	{
		scaleFactor = 1e6;
		prefix = "μ";
	}
	else if(num >= 1e-9)
	{
		scaleFactor = 1e9;
		prefix = "n";
	}
	else if(num >= 1e-12)
	{
		scaleFactor = 1e12;
		prefix = "p";
	}
	else
	{
		scaleFactor = 1e15;
		prefix = "f";
	}
}

string Unit::GetUnitSuffix() const
{
	switch(m_type)
	{
		case UNIT_FS:
			return "s";

		case UNIT_HZ:
			return "Hz";

		case UNIT_VOLTS:
			return "V";

		case UNIT_DB:
			return "dB";

		case UNIT_DEGREES:
			return "°";

		case UNIT_SAMPLERATE:
			return "S/s";

		case UNIT_SAMPLEDEPTH:
			return "S";

		default:
			return "";
	}
}

/**
	@brief Prints a value with SI scaling factors

	@param value	The value
	@param sigfigs	Number of significant digits to display, or -1 to trim trailing zeroes
 */
string Unit::PrettyPrint(double value, int sigfigs) const
{
	if(!isfinite(value))
		return "NaN";

	//Femtoseconds are printed as seconds with a prefix
	if(m_type == UNIT_FS)
		value *= 1e-15;

	double scaleFactor;
	string prefix;
	GetSIScalingFactor(value, scaleFactor, prefix);
	string suffix = GetUnitSuffix();

	double value_rescaled = value * scaleFactor;

	//Degree sign goes right after the number
	const char* space = " ";
	if(m_type == UNIT_DEGREES)
		space = "";

	char tmp[128];
	if(sigfigs > 0)
	{
		int leftdigits = 0;
		if(fabs(value_rescaled) >= 100)
			leftdigits = 3;
		else if(fabs(value_rescaled) >= 10)
			leftdigits = 2;
		else if(fabs(value_rescaled) >= 1)
			leftdigits = 1;
		int rightdigits = max(sigfigs - leftdigits, 0);

		string format = string("%.") + to_string(rightdigits) + "f%s%s%s";
		snprintf(tmp, sizeof(tmp), format.c_str(), value_rescaled, space, prefix.c_str(), suffix.c_str());
	}

	//If not a round number, add more digits (up to 5)
	else
	{
		if( fabs(round(value_rescaled) - value_rescaled) < 0.001 )
			snprintf(tmp, sizeof(tmp), "%.0f%s%s%s", value_rescaled, space, prefix.c_str(), suffix.c_str());
		else if(fabs(round(value_rescaled*10) - value_rescaled*10) < 0.001)
			snprintf(tmp, sizeof(tmp), "%.1f%s%s%s", value_rescaled, space, prefix.c_str(), suffix.c_str());
		else if(fabs(round(value_rescaled*100) - value_rescaled*100) < 0.001 )
			snprintf(tmp, sizeof(tmp), "%.2f%s%s%s", value_rescaled, space, prefix.c_str(), suffix.c_str());
		else if(fabs(round(value_rescaled*1000) - value_rescaled*1000) < 0.001 )
			snprintf(tmp, sizeof(tmp), "%.3f%s%s%s", value_rescaled, space, prefix.c_str(), suffix.c_str());
		else if(fabs(round(value_rescaled*10000) - value_rescaled*10000) < 0.001 )
			snprintf(tmp, sizeof(tmp), "%.4f%s%s%s", value_rescaled, space, prefix.c_str(), suffix.c_str());
		else
			snprintf(tmp, sizeof(tmp), "%.5f%s%s%s", value_rescaled, space, prefix.c_str(), suffix.c_str());
	}

	return string(tmp);
}

/**
	@brief Parses a string based on the supplied unit

	SI prefixes directly after the number are honored ("2.2M", "10 k", "500m").

	@return The parsed value, or NaN if the string does not start with a number
 */
double Unit::ParseString(const string& str) const
{
	//Find the first non-numeric character in the string
	double scale = 1;
	for(size_t i=0; i<str.size(); i++)
	{
		char c = str[i];
		if(isspace(c) || isdigit(c) || (c == '.') || (c == '-') || (c == '+') )
			continue;

		if(c == 'T')
			scale = 1e12;
		else if(c == 'G')
			scale = 1e9;
		else if(c == 'M')
			scale = 1e6;
		else if(c == 'K' || c == 'k')
			scale = 1e3;
		else if(c == 'm')
			scale = 1e-3;
		else if( (c == 'u') || (str.find("μ", i) == i) )
			scale = 1e-6;
		else if(c == 'n')
			scale = 1e-9;
		else if(c == 'p')
			scale = 1e-12;

		break;
	}

	//Parse the base value
	double ret;
	if(1 != sscanf(str.c_str(), "%20lf", &ret))
		return NAN;

	if(m_type == UNIT_FS)
		ret *= 1e15;

	return ret * scale;
}
