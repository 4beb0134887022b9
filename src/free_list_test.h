/*
 * free_list_test.h
 *
 * Entry point of the lfpool::free_list_head API/contract test.
 */

#ifndef FREE_LIST_TEST_H_
#define FREE_LIST_TEST_H_

int run_tst_free_list_api_paranoid(int argc, char** argv);

#endif /* FREE_LIST_TEST_H_ */
