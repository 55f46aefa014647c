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
	@brief Declaration of SCPIUARTTransport
 */

#ifndef SCPIUARTTransport_h
#define SCPIUARTTransport_h

#include <xptools/UART.h>

/**
	@brief Serial port connection, as used by the JDS6600

	Connection string is device[:baud], for example "/dev/ttyUSB0:115200".
 */
class SCPIUARTTransport : public SCPITransport
{
public:
	SCPIUARTTransport(const std::string& args);
	virtual ~SCPIUARTTransport();

	virtual std::string GetConnectionString() override;
	static std::string GetTransportName();

	virtual bool IsConnected() override;
	virtual void FlushRXBuffer() override;
	virtual size_t ReadRawData(size_t len, unsigned char* buf) override;

	TRANSPORT_INITPROC(SCPIUARTTransport)

	static const unsigned int DEFAULT_BAUD = 115200;

protected:
	virtual bool WriteRawData(const unsigned char* buf, size_t len) override;

	UART m_uart;
	std::string m_devfile;
	unsigned int m_baudrate;
};

#endif
