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
	@author Alyssa Milburn
	@brief Implementation of SCPIUARTTransport
 */

#include "bodehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPIUARTTransport::SCPIUARTTransport(const string& args)
	: m_devfile(args)
	, m_baudrate(DEFAULT_BAUD)
{
	//Device names never contain a colon, so anything after one is the baud rate
	auto colon = args.find(':');
	if(colon != string::npos)
	{
		m_devfile = args.substr(0, colon);
		if( (1 != sscanf(args.c_str() + colon + 1, "%u", &m_baudrate)) || (m_baudrate == 0) )
		{
			LogError("Bad baud rate in \"%s\"\n", args.c_str());
			return;
		}
	}

	LogDebug("Opening %s at %u baud\n", m_devfile.c_str(), m_baudrate);
	if(!m_uart.Connect(m_devfile, m_baudrate, false))
	{
		m_uart.Close();
		LogError("Couldn't open serial port %s\n", m_devfile.c_str());
	}
}

SCPIUARTTransport::~SCPIUARTTransport()
{
}

string SCPIUARTTransport::GetTransportName()
{
	return "uart";
}

string SCPIUARTTransport::GetConnectionString()
{
	return m_devfile + ":" + to_string(m_baudrate);
}

bool SCPIUARTTransport::IsConnected()
{
	return m_uart.IsValid();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Byte I/O

bool SCPIUARTTransport::WriteRawData(const unsigned char* buf, size_t len)
{
	return m_uart.Write(buf, len);
}

/**
	@brief Reads exactly len bytes

	The port's read timeout bounds the wait. Returns zero if it expired first.
 */
size_t SCPIUARTTransport::ReadRawData(size_t len, unsigned char* buf)
{
	if(!m_uart.Read(buf, len))
		return 0;
	return len;
}

/**
	@brief Drops stale bytes, e.g. a late ":ok" from a previous command
 */
void SCPIUARTTransport::FlushRXBuffer()
{
	if(!IsConnected())
		return;

	unsigned char c;
	size_t dropped = 0;
	while(ReadRawData(1, &c) == 1)
		dropped ++;
	if(dropped)
		LogDebug("Dropped %zu stale bytes on %s\n", dropped, m_devfile.c_str());
}
