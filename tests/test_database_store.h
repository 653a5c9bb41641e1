#ifndef TEST_DATABASE_STORE_H
#define TEST_DATABASE_STORE_H

void test_database_store();

#endif // TEST_DATABASE_STORE_H
