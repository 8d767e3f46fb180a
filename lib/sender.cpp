#include "sender.h"

#include <errno.h>			//for errno,ECONNREFUSED
#include <string.h>			//for memset
#include <unistd.h>			//for close
#include <netdb.h>			//for getaddrinfo,addrinfo,gai_strerror
#include <sys/socket.h>		//for socket,connect
#include <sys/stat.h>		//for stat
#include <vector>

#include "frame.h"
#include "md5sum.h"

using namespace std;

static string lastcomponent(const string &path)
{
	size_t pos = path.find_last_of('/');
	return pos == string::npos ? path : path.substr(pos + 1);
}

FileSender::FileSender(const XferConfig &config, const XferCallbacks &callbacks)
	: config(config), callbacks(callbacks)
{
}

int FileSender::connecttohost(const string &host, unsigned short portno)
{
	char port[8];
	snprintf(port, sizeof(port), "%u", (unsigned)portno);

	struct addrinfo hints, *res;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_STREAM;

	int rc = getaddrinfo(host.c_str(), port, &hints, &res);
	if(rc != 0)
	{
		callbacks.status("Error: Invalid address or hostname: " + host + " (" + gai_strerror(rc) + ")");
		return -1;
	}

	int lasterr = 0;
	for(struct addrinfo *ai = res; ai != NULL; ai = ai->ai_next)
	{
		int sockfd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if(sockfd < 0)
		{
			lasterr = errno;
			continue;
		}
		if(connect(sockfd, ai->ai_addr, ai->ai_addrlen) == 0)
		{
			freeaddrinfo(res);
			return sockfd;
		}
		lasterr = errno;
		close(sockfd);
	}
	freeaddrinfo(res);

	if(lasterr == ECONNREFUSED)
		callbacks.status("Error: Connection refused. Make sure the receiver is running at " + host + ":" + port);
	else
		callbacks.status("Error connecting to " + host + ":" + port + ": " + errnostr(lasterr));
	return -1;
}

int FileSender::sendchunks(int sockfd, FILE *fin, const TransferInfo &info)
{
	uint64_t totalchunks = (info.filesize + info.chunksize - 1) / info.chunksize;
	uint64_t chunkssent = 0, bytessent = 0;
	vector<char> chunk(info.chunksize);
	Md5Sum filesum;

	size_t n;
	while((n = fread(&chunk[0], 1, chunk.size(), fin)) > 0)
	{
		string checksum = md5hex(&chunk[0], n);
		filesum.update(&chunk[0], n);

		if(sendframe(sockfd, makechunkheader(n, checksum)) < 0 || sendall(sockfd, &chunk[0], n) < 0)
		{
			callbacks.status("Error sending file: " + errnostr(errno));
			return -1;
		}

		chunkssent++;
		bytessent += n;
		if(info.filesize > 0)
		{
			callbacks.progress((double)bytessent / info.filesize * 100.0,
				formatprogress(bytessent, info.filesize, chunkssent, totalchunks));
		}
	}
	if(ferror(fin))
	{
		callbacks.status("Error reading file " + info.filename + ": " + errnostr(errno));
		return -1;
	}

	if(sendterminator(sockfd) < 0)
	{
		callbacks.status("Error sending file: " + errnostr(errno));
		return -1;
	}
	if(bytessent == 0)
		callbacks.progress(100.0, formatprogress(0, 0, 0, 0));

	callbacks.status("md5sum of " + info.filename + " : " + filesum.hexdigest());
	return 0;
}

bool FileSender::sendfile(const string &path, const string &host, unsigned short portno)
{
	if(config.chunksize == 0)
	{
		callbacks.status("Error: chunk size must be positive");
		return false;
	}

	struct stat filestat;
	if(stat(path.c_str(), &filestat) < 0 || !S_ISREG(filestat.st_mode))
	{
		callbacks.status("Error: File '" + path + "' not found");
		return false;
	}

	TransferInfo info;
	info.filename = lastcomponent(path);
	info.filesize = filestat.st_size;
	info.chunksize = config.chunksize;

	ScopedFile fin(fopen(path.c_str(), "rb"));
	if(fin.get() == NULL)
	{
		callbacks.status("Error opening file '" + path + "': " + errnostr(errno));
		return false;
	}

	char str[21];
	snprintf(str, sizeof(str), "%llu", (unsigned long long)info.filesize);
	callbacks.status("Sending file: " + info.filename + " (" + str + " bytes)");
	callbacks.status("Connecting to " + host + ":" + to_string(portno) + "...");

	ScopedFd sockfd(connecttohost(host, portno));
	if(sockfd.get() < 0)
		return false;

	if(sendframe(sockfd.get(), makemetaheader(info)) < 0)
	{
		callbacks.status("Error sending file header: " + errnostr(errno));
		return false;
	}

	if(sendchunks(sockfd.get(), fin.get(), info) < 0)
		return false;

	callbacks.status("File sent successfully!");
	return true;
}
