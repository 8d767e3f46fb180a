#include "md5sum.h"

#include <stdio.h>		//for snprintf

using namespace std;

static string tohex(const unsigned char *c)
{
	char filehash[MD5HEXSIZE+1] = "";
	for(int i = 0; i < MD5_DIGEST_LENGTH; i++)
	{
		snprintf(filehash + 2*i, 3, "%02x", c[i]);
	}
	return string(filehash, MD5HEXSIZE);
}

Md5Sum::Md5Sum()
{
	MD5_Init(&context);
}

void Md5Sum::update(const char *data, size_t n)
{
	if(n > 0)
		MD5_Update(&context, data, n);
}

string Md5Sum::hexdigest() const
{
	// MD5_Final consumes the context, finish on a copy
	MD5_CTX mdContext = context;
	unsigned char c[MD5_DIGEST_LENGTH];
	MD5_Final(c, &mdContext);
	return tohex(c);
}

string md5hex(const char *data, size_t n)
{
	Md5Sum sum;
	sum.update(data, n);
	return sum.hexdigest();
}

string md5hex(const string &data)
{
	return md5hex(data.data(), data.size());
}
