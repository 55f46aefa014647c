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
	@brief Implementation of CSVExporter
 */

#include "bodeexports.h"
#include <unistd.h>
#include <errno.h>
#include <stdlib.h>
#include <sys/stat.h>

using namespace std;

CSVExporter::CSVExporter(bool phase)
	: m_phase(phase)
{
}

/**
	@brief Renders the whole file in memory
 */
string CSVExporter::Format(const vector<MeasurementResult>& results) const
{
	string ret = "Frequency in Hz;Gain in dB";
	if(m_phase)
		ret += ";Phase in Degree";
	ret += "\n";

	char buf[128];
	for(auto& r : results)
	{
		snprintf(buf, sizeof(buf), "%.10g;%.6g", r.m_frequency, r.m_gain);
		ret += buf;
		if(m_phase)
		{
			if(r.m_phase)
			{
				snprintf(buf, sizeof(buf), ";%.6g", *r.m_phase);
				ret += buf;
			}
			else
				ret += ";nan";
		}
		ret += "\n";
	}
	return ret;
}

/**
	@brief Writes the results to path, replacing any existing file

	@throw OutputWriteError if anything fails. No partial file is left behind.
 */
void CSVExporter::Export(const vector<MeasurementResult>& results, const string& path) const
{
	auto text = Format(results);
	auto tmp = MakeTempFile(path);

	FILE* fp = fopen(tmp.c_str(), "w");
	if(!fp)
	{
		unlink(tmp.c_str());
		throw OutputWriteError(string("Failed to open ") + tmp + ": " + strerror(errno));
	}

	bool ok = (fwrite(text.c_str(), 1, text.length(), fp) == text.length());
	if(fclose(fp) != 0)
		ok = false;
	if(!ok)
	{
		unlink(tmp.c_str());
		throw OutputWriteError(string("Failed to write ") + path);
	}

	ReplaceFile(tmp, path);
	LogNotice("Wrote %zu points to %s\n", results.size(), path.c_str());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Helpers shared by the exporters

/**
	@brief Creates an empty temporary file next to path and returns its name

	@throw OutputWriteError if the destination directory is not writable
 */
string MakeTempFile(const string& path)
{
	string tmpl = path + ".XXXXXX";
	vector<char> name(tmpl.begin(), tmpl.end());
	name.push_back('\0');

	int fd = mkstemp(&name[0]);
	if(fd < 0)
		throw OutputWriteError(string("Cannot create ") + path + ": " + strerror(errno));

	//mkstemp creates the file owner-only
	if(fchmod(fd, 0644) != 0)
		LogWarning("Could not set permissions on %s\n", &name[0]);
	close(fd);
	return string(&name[0]);
}

/**
	@brief Atomically moves a finished temporary file into place

	@throw OutputWriteError if the rename fails. The temporary file is removed.
 */
void ReplaceFile(const string& tmpPath, const string& path)
{
	if(rename(tmpPath.c_str(), path.c_str()) != 0)
	{
		int err = errno;
		unlink(tmpPath.c_str());
		throw OutputWriteError(string("Cannot replace ") + path + ": " + strerror(err));
	}
}
