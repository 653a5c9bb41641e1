#ifndef TEST_H
#define TEST_H

#include "tests/test_settings.h"
#include "tests/test_crypto.h"
#include "tests/test_factory.h"
#include "tests/test_votestorage.h"
#include "tests/test_metatx.h"
#include "tests/test_concurrency.h"
#include "tests/test_serialization.h"

void test_start()
{
    test_settings();
    test_crypto();
    test_factory();
    test_votestorage();
    test_metatx();
    test_concurrency();
    test_serialization();
}

#endif // TEST_H
