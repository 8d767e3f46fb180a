#ifndef XFER_SENDER_H
#define XFER_SENDER_H

#include <string>

#include "xfer.h"

/*
Streams one file to a listening FileReceiver: metadata frame, one chunk
frame per chunksize bytes, terminator. There is no acknowledgement, a
successful return means every byte was handed to the socket.
*/
class FileSender
{
	public:

	FileSender(const XferConfig &config, const XferCallbacks &callbacks);

	bool sendfile(const std::string &path, const std::string &host, unsigned short portno);

	private:

	// Connected socket, or -1 after reporting why.
	int connecttohost(const std::string &host, unsigned short portno);
	int sendchunks(int sockfd, FILE *fin, const TransferInfo &info);

	XferConfig config;
	XferCallbacks callbacks;
};

#endif
