#ifndef XFER_MD5SUM_H
#define XFER_MD5SUM_H

#include <stddef.h>
#include <openssl/md5.h>	//for md5 checksum functions
#include <string>

#define MD5HEXSIZE (MD5_DIGEST_LENGTH*2)

// Running md5 over data fed in pieces.
class Md5Sum
{
	public:

	Md5Sum();

	void update(const char *data, size_t n);

	// Lowercase hex of everything fed so far. Does not finish the sum.
	std::string hexdigest() const;

	private:

	MD5_CTX context;
};

std::string md5hex(const char *data, size_t n);
std::string md5hex(const std::string &data);

#endif
